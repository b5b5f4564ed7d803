#include "estimation.hpp"

#include <cmath>
#include <iostream>

#include "exceptions.hpp"

namespace estimation {

Estimate estimate(const Graph &graph, const Assignment &partition, const IQualityModel &model,
                  const ModelContext &context, const IMinimizer &minimizer, double current) {
    Estimate result;
    result.value = current;
    if (context.total_weight == 0.0) return result;
    PartitionStatistics partition_statistics = statistics::compute(graph, partition, context);
    double value = model.estimate_parameter(partition_statistics, minimizer);
    if (!std::isfinite(value)) {
        throw OptimizationError("estimated " + model.parameter_name() + " is not finite", current);
    }
    result.value = model.clamp(value);
    if (!model.is_valid(value)) {
        std::cerr << "WARNING: estimated " << model.parameter_name() << " = " << value << " is outside of its domain,"
                  << " clamping to " << result.value << std::endl;
        result.clamped = true;
    }
    return result;
}

}  // namespace estimation
