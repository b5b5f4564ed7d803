#include "statistics.hpp"

#include "utils.hpp"

namespace statistics {

ModelContext model_context(const Graph &graph) {
    ModelContext context;
    context.total_weight = graph.total_weight();
    context.num_vertices = graph.num_vertices();
    context.pairs = double(context.num_vertices) * double(context.num_vertices - 1) / 2.0;
    for (double degree : graph.degrees()) {
        context.degree_log_degree += utils::xlogy(degree, degree);
    }
    return context;
}

PartitionStatistics compute(const CommunityAggregates &aggregates, const ModelContext &context) {
    PartitionStatistics result;
    result.total_weight = context.total_weight;
    result.pairs = context.pairs;
    result.degree_log_degree = context.degree_log_degree;
    long num_vertices = aggregates.graph().num_vertices();
    for (long community = 0; community < num_vertices; ++community) {
        long size = aggregates.size(community);
        if (size == 0) continue;
        double degree = aggregates.degree(community);
        double internal = aggregates.internal_weight(community);
        result.internal_weight += internal;
        result.degrees_squared += degree * degree;
        result.pairs_within += double(size) * double(size - 1) / 2.0;
        result.community_degrees.push_back(degree);
        result.community_internals.push_back(internal);
    }
    result.external_weight = result.total_weight - result.internal_weight;
    if (result.external_weight < 0.0) result.external_weight = 0.0;
    return result;
}

PartitionStatistics compute(const Graph &graph, const Assignment &partition, const ModelContext &context) {
    CommunityAggregates aggregates(graph, utils::constant<long>(graph.num_vertices(), 1), partition);
    return compute(aggregates, context);
}

}  // namespace statistics
