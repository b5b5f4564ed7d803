/**
 * The multi-level Louvain heuristic, for a fixed model parameter.
 */
#ifndef MLL_LOUVAIN_HPP
#define MLL_LOUVAIN_HPP

#include "graph.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "rng.hpp"
#include "statistics.hpp"
#include "typedefs.hpp"

namespace louvain {

typedef struct dendrogram_result_t {
    Dendrogram dendrogram;
    /// True if the local search reached a local optimum on every level
    bool converged = true;
    /// The objective of the top level
    double quality = 0.0;
    /// Total number of vertex moves, over all levels
    long moves = 0;
} DendrogramResult;

/// Alternates local moves and aggregation until a level produces no move, or improves the objective by less than
/// local_search::MIN_IMPROVEMENT. The first level is always kept. Every
/// partition stored in the dendrogram has compact ids. A graph without edges yields a single all-singleton level.
DendrogramResult generate_dendrogram(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                                     double parameter, const Options &options, rng::Gen &generator);

/// Same as above, but the local search of the first level starts from `initial_partition` instead of singletons.
/// Any non-negative community ids are accepted. Throws a ValidationError if the partition does not cover exactly the
/// vertices of the graph. A graph without edges yields the initial partition as its single level.
DendrogramResult generate_dendrogram(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                                     double parameter, const Options &options, rng::Gen &generator,
                                     const Assignment &initial_partition);

/// Returns the partition of the original vertices given by the top level of the dendrogram.
Assignment best_partition(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                          double parameter, const Options &options, rng::Gen &generator);

}  // namespace louvain

#endif // MLL_LOUVAIN_HPP
