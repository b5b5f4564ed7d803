/***
 * Sufficient statistics of a graph and of a partition, from which every model evaluates its objective and its
 * log-likelihood.
 */
#ifndef MLL_STATISTICS_HPP
#define MLL_STATISTICS_HPP

#include <vector>

#include "aggregates.hpp"
#include "graph.hpp"

/// Quantities that depend only on the original graph, shared by every level of the hierarchy.
typedef struct model_context_t {
    /// E, the sum of edge weights
    double total_weight = 0.0;
    /// N, the number of original vertices
    long num_vertices = 0;
    /// N * (N - 1) / 2
    double pairs = 0.0;
    /// sum_v d_v * log(d_v) over the original vertices
    double degree_log_degree = 0.0;
} ModelContext;

typedef struct partition_statistics_t {
    double total_weight = 0.0;       // E
    double internal_weight = 0.0;    // Ein
    double external_weight = 0.0;    // Eout = E - Ein
    double degrees_squared = 0.0;    // sum_c D_c^2
    double pairs_within = 0.0;       // sum_c n_c * (n_c - 1) / 2
    double pairs = 0.0;              // N * (N - 1) / 2
    double degree_log_degree = 0.0;  // sum_v d_v * log(d_v)
    /// D_c and in_c of every non-empty community
    std::vector<double> community_degrees;
    std::vector<double> community_internals;
} PartitionStatistics;

namespace statistics {

/// Computes the context of the original `graph`.
ModelContext model_context(const Graph &graph);

/// Collects the statistics of the partition described by `aggregates`, in O(num_vertices).
PartitionStatistics compute(const CommunityAggregates &aggregates, const ModelContext &context);

/// Collects the statistics of `partition` over the original `graph`. Community ids must lie in
/// [0, graph.num_vertices()).
PartitionStatistics compute(const Graph &graph, const Assignment &partition, const ModelContext &context);

}  // namespace statistics

#endif // MLL_STATISTICS_HPP
