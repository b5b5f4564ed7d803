#include "model/ilfr.hpp"

#include <algorithm>
#include <cmath>

#include "exceptions.hpp"

namespace {

/// internal * log((1 - mu) / degree + mu / 2E), or 0 when there is no internal weight.
double community_term(double internal, double degree, double mu, double total_weight) {
    if (internal == 0.0 || degree <= 0.0) return 0.0;
    return internal * std::log((1.0 - mu) / degree + mu / (2.0 * total_weight));
}

}  // namespace

double ILFR::remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                         const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    long community = aggregates.community(vertex);
    double degree = aggregates.vertex_degree(vertex);
    double loops = aggregates.vertex_loops(vertex);
    double internal = aggregates.internal_weight(community);
    double community_degree = aggregates.degree(community);
    return weight_to_community * (std::log(mu) - std::log(2.0 * E))
           - community_term(internal, community_degree, mu, E)
           + community_term(internal - loops - weight_to_community, community_degree - degree, mu, E)
           + community_term(loops, degree, mu, E);
}

double ILFR::insert_gain(const CommunityAggregates &aggregates, long vertex, long community,
                         double weight_to_community, const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    double degree = aggregates.vertex_degree(vertex);
    double loops = aggregates.vertex_loops(vertex);
    double internal = aggregates.internal_weight(community);
    double community_degree = aggregates.degree(community);
    return weight_to_community * (std::log(2.0 * E) - std::log(mu))
           - community_term(internal, community_degree, mu, E)
           - community_term(loops, degree, mu, E)
           + community_term(internal + loops + weight_to_community, community_degree + degree, mu, E);
}

double ILFR::quality(const PartitionStatistics &statistics, double parameter) const {
    return this->log_likelihood(statistics, parameter);
}

double ILFR::log_likelihood(const PartitionStatistics &statistics, double parameter) const {
    double E = statistics.total_weight;
    if (E == 0.0) return 0.0;
    double mu = this->clamp(parameter);
    double result = statistics.external_weight * (std::log(mu) - std::log(2.0 * E)) + statistics.degree_log_degree
                    - E;
    for (size_t community = 0; community < statistics.community_degrees.size(); ++community) {
        result += community_term(statistics.community_internals[community], statistics.community_degrees[community],
                                 mu, E);
    }
    return result;
}

double ILFR::estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const {
    double guess = this->clamp(statistics.external_weight / statistics.total_weight);
    auto objective = [this, &statistics](double mu) { return -this->log_likelihood(statistics, mu); };
    double mu = minimizer.minimize(objective, ILFR_EPSILON, 1.0 - ILFR_EPSILON);
    if (!std::isfinite(mu) || !std::isfinite(objective(mu))) {
        throw OptimizationError("minimizer returned a non-finite estimate of mu", guess);
    }
    double reference = objective(guess);
    if (objective(mu) > reference + 1e-6 * std::max(1.0, std::fabs(reference))) {
        throw OptimizationError("minimizer did not improve on mu = Eout / E", guess);
    }
    return mu;
}

bool ILFR::is_valid(double parameter) const {
    return std::isfinite(parameter) && parameter > 0.0 && parameter < 1.0;
}

double ILFR::clamp(double parameter) const {
    return std::min(std::max(parameter, ILFR_EPSILON), 1.0 - ILFR_EPSILON);
}
