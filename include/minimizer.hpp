/***
 * Bounded scalar minimization, used to estimate model parameters that have no closed form.
 */
#ifndef MLL_MINIMIZER_HPP
#define MLL_MINIMIZER_HPP

#include <cstdint>
#include <functional>
#include <limits>

class IMinimizer {
public:
    virtual ~IMinimizer() = default;
    /// Returns the argument in [`lower`, `upper`] at which `objective` is smallest. Blocks until done.
    virtual double minimize(const std::function<double(double)> &objective, double lower, double upper) const = 0;
};

/// Brent's method, as implemented by Boost.Math.
class BrentMinimizer : public IMinimizer {
public:
    explicit BrentMinimizer(int bits = std::numeric_limits<double>::digits / 2,
                            std::uintmax_t max_iterations = 500) {
        this->_bits = bits;
        this->_max_iterations = max_iterations;
    }
    double minimize(const std::function<double(double)> &objective, double lower, double upper) const override;
private:
    int _bits;
    std::uintmax_t _max_iterations;
};

#endif // MLL_MINIMIZER_HPP
