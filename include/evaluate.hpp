/***
 * Compares a partition against another one, usually a ground truth.
 */
#ifndef MLL_EVALUATE_HPP
#define MLL_EVALUATE_HPP

#include "fs.hpp"
#include "typedefs.hpp"

namespace evaluate {

typedef struct comparison_t {
    double rand = 0.0;
    double jaccard = 0.0;
    /// Mutual information normalized by the geometric mean of the two entropies
    double nmi = 0.0;
} Comparison;

/// Pair-counting and information-theoretic similarity of two partitions of the same vertices.
Comparison compare_partitions(const Assignment &lhs, const Assignment &rhs);

/// Reads a ground-truth partition from lines of "vertex community" pairs, where vertex ids start at 1. Throws a
/// ValidationError if a vertex in [0, num_vertices) has no community.
Assignment load_truth(const fs::path &filepath, long num_vertices);

}  // namespace evaluate

#endif // MLL_EVALUATE_HPP
