#include "rng.hpp"

namespace rng {

Gen generator(unsigned long seed) {
    std::seed_seq seed_source { (unsigned int) (seed & 0xFFFFFFFFul), (unsigned int) (seed >> 16 >> 16) };
    return Gen(seed_source);
}

}  // namespace rng
