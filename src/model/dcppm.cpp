#include "model/dcppm.hpp"

#include <algorithm>
#include <cmath>

namespace {

typedef struct rates_t {
    double p_in;
    double p_out;
} Rates;

Rates rates(const PartitionStatistics &statistics) {
    double E = statistics.total_weight;
    double degrees_squared = statistics.degrees_squared;
    double outside = 4.0 * E * E - degrees_squared;
    Rates result;
    result.p_in = (degrees_squared > 0.0) ? 4.0 * statistics.internal_weight * E / degrees_squared : 0.0;
    result.p_out = (statistics.external_weight > 0.0 && outside > 0.0)
                   ? 4.0 * statistics.external_weight * E / outside : 0.0;
    result.p_in = std::max(result.p_in, DCPPM_EPSILON);
    result.p_out = std::max(result.p_out, DCPPM_EPSILON);
    return result;
}

}  // namespace

double DCPPM::remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                          const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double degree = aggregates.vertex_degree(vertex);
    double remaining = aggregates.degree(aggregates.community(vertex)) - degree;
    return (parameter * degree * remaining / (2.0 * E) - weight_to_community) / E;
}

double DCPPM::insert_gain(const CommunityAggregates &aggregates, long vertex, long community,
                          double weight_to_community, const ModelContext &context, double parameter) const {
    double E = context.total_weight;
    if (E == 0.0) return 0.0;
    double degree = aggregates.vertex_degree(vertex);
    return (weight_to_community - parameter * degree * aggregates.degree(community) / (2.0 * E)) / E;
}

double DCPPM::quality(const PartitionStatistics &statistics, double parameter) const {
    double E = statistics.total_weight;
    if (E == 0.0) return 0.0;
    return statistics.internal_weight / E - parameter * statistics.degrees_squared / (4.0 * E * E);
}

double DCPPM::log_likelihood(const PartitionStatistics &statistics, double /* parameter */) const {
    double E = statistics.total_weight;
    if (E == 0.0) return 0.0;
    Rates r = rates(statistics);
    double log_p_in = std::log(r.p_in);
    double log_p_out = std::log(r.p_out);
    return statistics.internal_weight * (log_p_in - log_p_out)
           - (r.p_in - r.p_out) * statistics.degrees_squared / (4.0 * E)
           + statistics.degree_log_degree + E * log_p_out - E * r.p_out - E * std::log(2.0 * E);
}

double DCPPM::estimate_parameter(const PartitionStatistics &statistics, const IMinimizer & /* minimizer */) const {
    Rates r = rates(statistics);
    double log_ratio = std::log(r.p_in) - std::log(r.p_out);
    if (std::fabs(log_ratio) < 1e-12) return r.p_in;
    return (r.p_in - r.p_out) / log_ratio;
}

bool DCPPM::is_valid(double parameter) const {
    return std::isfinite(parameter) && parameter > 0.0;
}

double DCPPM::clamp(double parameter) const {
    return std::max(parameter, DCPPM_EPSILON);
}
