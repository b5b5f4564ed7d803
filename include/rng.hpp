#ifndef MLL_RNG_HPP
#define MLL_RNG_HPP

#include <random>

namespace rng {

typedef std::mt19937 Gen;

/// Returns a generator whose whole state is derived from `seed`. Equal seeds give equal sequences.
Gen generator(unsigned long seed);

}  // namespace rng

#endif // MLL_RNG_HPP
