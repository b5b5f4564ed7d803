/**
 * The local moving phase of the Louvain algorithm: greedily moves single vertices between communities of one level.
 */
#ifndef MLL_LOCAL_SEARCH_HPP
#define MLL_LOCAL_SEARCH_HPP

#include "aggregates.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "rng.hpp"
#include "statistics.hpp"

namespace local_search {

/// A sweep that improves the objective by less than this counts as a local optimum.
static const double MIN_IMPROVEMENT = 1e-7;

typedef struct level_result_t {
    /// Total number of vertex moves over all sweeps
    long moves = 0;
    long passes = 0;
    /// False if the sweep limit was reached before a local optimum
    bool converged = false;
    /// The objective of the final partition
    double quality = 0.0;
} LevelResult;

/// Returns the community that `vertex` should join: the one with the largest strictly positive gain, or the current
/// community if no move improves the objective. Ties keep the first community encountered. Leaves the aggregates
/// unchanged.
long best_community(const CommunityAggregates &aggregates, long vertex, const IQualityModel &model,
                     const ModelContext &context, double parameter);

/// Sweeps the vertices of the level in a shuffled order, moving each to its best community, until no vertex moves,
/// a sweep improves the objective by less than MIN_IMPROVEMENT, or `options.max_passes` sweeps have run.
LevelResult one_level(CommunityAggregates &aggregates, const IQualityModel &model, const ModelContext &context,
                      double parameter, const Options &options, rng::Gen &generator);

}  // namespace local_search

#endif // MLL_LOCAL_SEARCH_HPP
