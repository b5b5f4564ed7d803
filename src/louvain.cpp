#include "louvain.hpp"

#include <iostream>
#include <string>

#include "aggregates.hpp"
#include "aggregation.hpp"
#include "exceptions.hpp"
#include "local_search.hpp"
#include "utils.hpp"

namespace louvain {

DendrogramResult generate_dendrogram(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                                     double parameter, const Options &options, rng::Gen &generator) {
    return generate_dendrogram(graph, model, context, parameter, options, generator,
                               utils::range<long>(0, graph.num_vertices()));
}

DendrogramResult generate_dendrogram(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                                     double parameter, const Options &options, rng::Gen &generator,
                                     const Assignment &initial_partition) {
    if ((long) initial_partition.size() != graph.num_vertices()) {
        throw ValidationError("initial partition has " + std::to_string(initial_partition.size())
                              + " entries, graph has " + std::to_string(graph.num_vertices()) + " vertices");
    }
    aggregation::num_communities(initial_partition);  // rejects negative ids
    Assignment start = aggregation::renumber(initial_partition);
    DendrogramResult result;
    std::vector<long> vertex_sizes = utils::constant<long>(graph.num_vertices(), 1);
    if (graph.total_weight() == 0.0) {
        result.dendrogram.push_back(start);
        return result;
    }
    CommunityAggregates aggregates(graph, vertex_sizes, start);
    local_search::LevelResult level_result = local_search::one_level(aggregates, model, context, parameter, options,
                                                                     generator);
    Assignment partition = aggregation::renumber(aggregates.assignment());
    result.dendrogram.push_back(partition);
    result.converged = level_result.converged;
    result.quality = level_result.quality;
    result.moves = level_result.moves;
    aggregation::Level level = aggregation::induced_level(graph, vertex_sizes, partition);
    while (true) {
        if (options.verbose) {
            std::cout << "Level: " << result.dendrogram.size() << ", communities: " << level.graph.num_vertices()
                      << ", quality: " << result.quality << std::endl;
        }
        CommunityAggregates level_aggregates(level.graph, level.vertex_sizes);
        level_result = local_search::one_level(level_aggregates, model, context, parameter, options, generator);
        if (level_result.moves == 0 || level_result.quality - result.quality < local_search::MIN_IMPROVEMENT) break;
        partition = aggregation::renumber(level_aggregates.assignment());
        result.dendrogram.push_back(partition);
        result.converged = result.converged && level_result.converged;
        result.quality = level_result.quality;
        result.moves += level_result.moves;
        level = aggregation::induced_level(level.graph, level.vertex_sizes, partition);
    }
    return result;
}

Assignment best_partition(const Graph &graph, const IQualityModel &model, const ModelContext &context,
                          double parameter, const Options &options, rng::Gen &generator) {
    DendrogramResult result = generate_dendrogram(graph, model, context, parameter, options, generator);
    return aggregation::flatten(result.dendrogram);
}

}  // namespace louvain
