#include "model/ppm.hpp"

#include <algorithm>
#include <cmath>

#include "utils.hpp"

namespace {

typedef struct rates_t {
    double p_in;
    double p_out;
} Rates;

Rates rates(const PartitionStatistics &statistics) {
    double pairs_within = std::max(statistics.pairs_within, PPM_EPSILON);
    double pairs_between = std::max(statistics.pairs - statistics.pairs_within, PPM_EPSILON);
    Rates result;
    result.p_in = std::max(statistics.internal_weight / pairs_within, PPM_EPSILON);
    result.p_out = std::max(statistics.external_weight / pairs_between, PPM_EPSILON);
    return result;
}

}  // namespace

double PPM::remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                        const ModelContext &context, double parameter) const {
    if (context.total_weight == 0.0) return 0.0;
    double penalty = (context.pairs > 0.0) ? parameter * double(aggregates.vertex_size(vertex)) / context.pairs : 0.0;
    long community = aggregates.community(vertex);
    double remaining = double(aggregates.size(community) - aggregates.vertex_size(vertex));
    return remaining * penalty - weight_to_community / context.total_weight;
}

double PPM::insert_gain(const CommunityAggregates &aggregates, long vertex, long community,
                        double weight_to_community, const ModelContext &context, double parameter) const {
    if (context.total_weight == 0.0) return 0.0;
    double penalty = (context.pairs > 0.0) ? parameter * double(aggregates.vertex_size(vertex)) / context.pairs : 0.0;
    return weight_to_community / context.total_weight - double(aggregates.size(community)) * penalty;
}

double PPM::quality(const PartitionStatistics &statistics, double parameter) const {
    if (statistics.total_weight == 0.0) return 0.0;
    double result = statistics.internal_weight / statistics.total_weight;
    if (statistics.pairs > 0.0) result -= parameter * statistics.pairs_within / statistics.pairs;
    return result;
}

double PPM::log_likelihood(const PartitionStatistics &statistics, double /* parameter */) const {
    if (statistics.total_weight == 0.0) return 0.0;
    Rates r = rates(statistics);
    return -statistics.total_weight + utils::xlogy(statistics.internal_weight, r.p_in)
           + utils::xlogy(statistics.external_weight, r.p_out);
}

double PPM::estimate_parameter(const PartitionStatistics &statistics, const IMinimizer & /* minimizer */) const {
    Rates r = rates(statistics);
    double log_ratio = std::log(r.p_in) - std::log(r.p_out);
    // (p_in - p_out) / (log p_in - log p_out) tends to p_in as the rates meet
    double rate = (std::fabs(log_ratio) < 1e-12) ? r.p_in : (r.p_in - r.p_out) / log_ratio;
    return statistics.pairs * rate / statistics.total_weight;
}

bool PPM::is_valid(double parameter) const {
    return std::isfinite(parameter) && parameter > 0.0;
}

double PPM::clamp(double parameter) const {
    return std::max(parameter, PPM_EPSILON);
}
