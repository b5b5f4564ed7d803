#include "local_search.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "utils.hpp"

namespace local_search {

namespace {

long best_community(const CommunityAggregates &aggregates, const NeighborCommunities &neighbors, long vertex,
                    const IQualityModel &model, const ModelContext &context, double parameter) {
    long current = aggregates.community(vertex);
    double remove_gain = model.remove_gain(aggregates, vertex, neighbors.weight(current), context, parameter);
    long best = current;
    double best_gain = 0.0;
    for (long community : neighbors.communities) {
        if (community == current) continue;
        double gain = remove_gain + model.insert_gain(aggregates, vertex, community, neighbors.weight(community),
                                                      context, parameter);
        if (gain > best_gain) {
            best = community;
            best_gain = gain;
        }
    }
    return best;
}

}  // namespace

long best_community(const CommunityAggregates &aggregates, long vertex, const IQualityModel &model,
                    const ModelContext &context, double parameter) {
    NeighborCommunities neighbors = aggregates.neighbor_communities(vertex);
    return best_community(aggregates, neighbors, vertex, model, context, parameter);
}

LevelResult one_level(CommunityAggregates &aggregates, const IQualityModel &model, const ModelContext &context,
                      double parameter, const Options &options, rng::Gen &generator) {
    LevelResult result;
    std::vector<long> vertices = utils::range<long>(0, aggregates.graph().num_vertices());
    double quality = model.quality(statistics::compute(aggregates, context), parameter);
    while (options.max_passes < 0 || result.passes < options.max_passes) {
        result.passes++;
        std::shuffle(vertices.begin(), vertices.end(), generator);
        long vertex_moves = 0;
        for (long vertex : vertices) {
            NeighborCommunities neighbors = aggregates.neighbor_communities(vertex);
            long current = aggregates.community(vertex);
            long best = best_community(aggregates, neighbors, vertex, model, context, parameter);
            if (best == current) continue;
            aggregates.remove(vertex, neighbors.weight(current));
            aggregates.insert(vertex, best, neighbors.weight(best));
            vertex_moves++;
        }
        result.moves += vertex_moves;
        double new_quality = model.quality(statistics::compute(aggregates, context), parameter);
        double improvement = new_quality - quality;
        quality = new_quality;
        if (options.verbose) {
            std::cout << "Pass: " << result.passes << ", number of vertex moves: " << vertex_moves << ", quality: "
                      << quality << std::endl;
        }
        if (vertex_moves == 0 || improvement < MIN_IMPROVEMENT) {
            result.converged = true;
            break;
        }
    }
    result.quality = quality;
    return result;
}

}  // namespace local_search
