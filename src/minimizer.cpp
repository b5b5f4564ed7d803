#include "minimizer.hpp"

#include <utility>

#include <boost/math/tools/minima.hpp>

double BrentMinimizer::minimize(const std::function<double(double)> &objective, double lower, double upper) const {
    std::uintmax_t iterations = this->_max_iterations;
    std::pair<double, double> result = boost::math::tools::brent_find_minima(
            [&objective](double x) { return objective(x); }, lower, upper, this->_bits, iterations);
    return result.first;
}
