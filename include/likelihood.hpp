/**
 * Stateless evaluation of partitions: log-likelihood, model objective, and ranking of independent runs.
 */
#ifndef MLL_LIKELIHOOD_HPP
#define MLL_LIKELIHOOD_HPP

#include <vector>

#include "graph.hpp"
#include "model/quality_model.hpp"
#include "statistics.hpp"
#include "typedefs.hpp"

namespace likelihood {

/// Returns the log-likelihood of `graph` given `partition` under `model`. Any non-negative community ids are
/// accepted. Throws a ValidationError if the partition does not cover exactly the vertices of the graph.
double log_likelihood(const Graph &graph, const Assignment &partition, const IQualityModel &model,
                      const ModelContext &context, double parameter);

/// Returns the objective that the local search maximizes, under the same conventions as log_likelihood().
double quality(const Graph &graph, const Assignment &partition, const IQualityModel &model,
               const ModelContext &context, double parameter);

/// Returns the indices of independent runs ordered from the highest to the lowest log-likelihood. Ties keep the
/// order of the runs; NaN values are ranked last.
std::vector<long> rank(const std::vector<double> &log_likelihoods);

/// Checks that `partition` assigns every vertex of `graph` to a non-negative community, and returns it with compact
/// ids.
Assignment validated(const Graph &graph, const Assignment &partition);

}  // namespace likelihood

#endif // MLL_LIKELIHOOD_HPP
