/**
 * Folds a partitioned level of the hierarchy into a coarser one, and composes the partitions of several levels.
 */
#ifndef MLL_AGGREGATION_HPP
#define MLL_AGGREGATION_HPP

#include <vector>

#include "graph.hpp"
#include "typedefs.hpp"

namespace aggregation {

/// A level of the hierarchy: its graph, and the number of original vertices behind each of its vertices.
typedef struct level_t {
    Graph graph;
    std::vector<long> vertex_sizes;
} Level;

/// Returns the partition of the original vertices given by the top level of the dendrogram. Throws a
/// ValidationError if the dendrogram is empty.
Assignment flatten(const Dendrogram &dendrogram);

/// Builds the graph induced by `partition`, whose ids must be compact. Every community becomes a vertex; the weights
/// of the edges between two communities are summed; the self-loop of a community is the sum of the self-loops and
/// of the internal edge weights of its members. The total weight is preserved.
Level induced_level(const Graph &graph, const std::vector<long> &vertex_sizes, const Assignment &partition);

/// Returns the number of communities of a partition with compact ids.
long num_communities(const Assignment &partition);

/// Returns the partition of the original vertices at `level` of the dendrogram: level 0 is the finest partition,
/// and every further level merges the communities of the previous one.
Assignment partition_at_level(const Dendrogram &dendrogram, long level);

/// Relabels the communities of `assignment` as 0..k-1, in order of first appearance.
Assignment renumber(const Assignment &assignment);

}  // namespace aggregation

#endif // MLL_AGGREGATION_HPP
