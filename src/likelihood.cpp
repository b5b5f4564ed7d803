#include "likelihood.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "aggregation.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

namespace likelihood {

double log_likelihood(const Graph &graph, const Assignment &partition, const IQualityModel &model,
                      const ModelContext &context, double parameter) {
    Assignment compact = validated(graph, partition);
    return model.log_likelihood(statistics::compute(graph, compact, context), parameter);
}

double quality(const Graph &graph, const Assignment &partition, const IQualityModel &model,
               const ModelContext &context, double parameter) {
    Assignment compact = validated(graph, partition);
    return model.quality(statistics::compute(graph, compact, context), parameter);
}

std::vector<long> rank(const std::vector<double> &log_likelihoods) {
    std::vector<long> indices = utils::range<long>(0, long(log_likelihoods.size()));
    std::stable_sort(indices.begin(), indices.end(), [&log_likelihoods](long a, long b) {
        double lhs = log_likelihoods[a];
        double rhs = log_likelihoods[b];
        if (std::isnan(rhs)) return !std::isnan(lhs);
        return lhs > rhs;
    });
    return indices;
}

Assignment validated(const Graph &graph, const Assignment &partition) {
    if ((long) partition.size() != graph.num_vertices()) {
        throw ValidationError("partition has " + std::to_string(partition.size()) + " entries, graph has "
                              + std::to_string(graph.num_vertices()) + " vertices");
    }
    for (long community : partition) {
        if (community < 0) throw ValidationError("negative community id " + std::to_string(community));
    }
    return aggregation::renumber(partition);
}

}  // namespace likelihood
