#include "model/ilfrs.hpp"

#include <algorithm>
#include <cmath>

#include "utils.hpp"

double ILFRs::remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                          const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    // Cost of turning a unit of internal weight into external weight
    double unit = std::log(2.0 * E) + std::log(1.0 - mu) - std::log(mu);
    long community = aggregates.community(vertex);
    double degree = aggregates.vertex_degree(vertex);
    double loops = aggregates.vertex_loops(vertex);
    double internal = aggregates.internal_weight(community);
    double community_degree = aggregates.degree(community);
    double remaining_internal = internal - loops - weight_to_community;
    double remaining_degree = community_degree - degree;
    double result = -weight_to_community * unit + utils::xlogy(internal, community_degree)
                    - utils::xlogy(loops, degree);
    if (remaining_degree > 0.0) result -= utils::xlogy(remaining_internal, remaining_degree);
    return result;
}

double ILFRs::insert_gain(const CommunityAggregates &aggregates, long vertex, long community,
                          double weight_to_community, const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    double unit = std::log(2.0 * E) + std::log(1.0 - mu) - std::log(mu);
    double degree = aggregates.vertex_degree(vertex);
    double loops = aggregates.vertex_loops(vertex);
    double internal = aggregates.internal_weight(community);
    double community_degree = aggregates.degree(community);
    return weight_to_community * unit + utils::xlogy(internal, community_degree) + utils::xlogy(loops, degree)
           - utils::xlogy(internal + loops + weight_to_community, community_degree + degree);
}

double ILFRs::quality(const PartitionStatistics &statistics, double parameter) const {
    return this->log_likelihood(statistics, parameter);
}

double ILFRs::log_likelihood(const PartitionStatistics &statistics, double parameter) const {
    double E = statistics.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    double result = utils::xlogy(statistics.external_weight, mu) + utils::xlogy(statistics.internal_weight, 1.0 - mu)
                    - utils::xlogy(statistics.external_weight, 2.0 * E) - E + statistics.degree_log_degree;
    for (size_t community = 0; community < statistics.community_degrees.size(); ++community) {
        result -= utils::xlogy(statistics.community_internals[community], statistics.community_degrees[community]);
    }
    return result;
}

double ILFRs::estimate_parameter(const PartitionStatistics &statistics, const IMinimizer & /* minimizer */) const {
    return statistics.external_weight / statistics.total_weight;
}

bool ILFRs::is_valid(double parameter) const {
    return std::isfinite(parameter) && parameter > 0.0 && parameter < 1.0;
}

double ILFRs::clamp(double parameter) const {
    return std::min(std::max(parameter, ILFRS_EPSILON), 1.0 - ILFRS_EPSILON);
}
