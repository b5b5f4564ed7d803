/**
 * Estimates the model parameter that best explains a fixed partition.
 */
#ifndef MLL_ESTIMATION_HPP
#define MLL_ESTIMATION_HPP

#include "graph.hpp"
#include "minimizer.hpp"
#include "model/quality_model.hpp"
#include "statistics.hpp"
#include "typedefs.hpp"

namespace estimation {

typedef struct estimate_t {
    double value = 0.0;
    /// True if the raw estimate fell outside of the parameter's domain and was clamped
    bool clamped = false;
} Estimate;

/// Returns the maximum likelihood parameter of `model` for `partition`, clamped into the model's domain with a
/// warning if needed. Returns `current` unchanged for a graph without edges. Throws an OptimizationError if the
/// estimate is not finite, or if the minimizer fails.
Estimate estimate(const Graph &graph, const Assignment &partition, const IQualityModel &model,
                  const ModelContext &context, const IMinimizer &minimizer, double current);

}  // namespace estimation

#endif // MLL_ESTIMATION_HPP
