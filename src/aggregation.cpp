#include "aggregation.hpp"

#include <algorithm>
#include <string>

#include "exceptions.hpp"
#include "utils.hpp"

namespace aggregation {

Assignment flatten(const Dendrogram &dendrogram) {
    if (dendrogram.empty()) throw ValidationError("cannot flatten an empty dendrogram");
    return partition_at_level(dendrogram, long(dendrogram.size()) - 1);
}

Level induced_level(const Graph &graph, const std::vector<long> &vertex_sizes, const Assignment &partition) {
    if ((long) partition.size() != graph.num_vertices()) {
        throw ValidationError("partition has " + std::to_string(partition.size()) + " entries, graph has "
                              + std::to_string(graph.num_vertices()) + " vertices");
    }
    long communities = num_communities(partition);
    Level level;
    level.vertex_sizes = utils::constant<long>(communities, 0);
    std::vector<double> self_loops = utils::constant<double>(communities, 0.0);
    // Inter-community weights, keyed on the lower community id
    std::vector<MapVector<double>> links(communities);
    for (long vertex = 0; vertex < graph.num_vertices(); ++vertex) {
        long community = partition[vertex];
        level.vertex_sizes[community] += vertex_sizes[vertex];
        self_loops[community] += graph.self_loop_weight(vertex);
        for (const WeightedEdge &edge : graph.neighbors(vertex)) {
            if (edge.first < vertex) continue;
            long neighbor_community = partition[edge.first];
            if (neighbor_community == community) {
                self_loops[community] += edge.second;
            } else {
                long low = std::min(community, neighbor_community);
                long high = std::max(community, neighbor_community);
                links[low][high] += edge.second;
            }
        }
    }
    NeighborList neighbors(communities);
    for (long community = 0; community < communities; ++community) {
        for (const auto &link : links[community]) {
            neighbors[community].emplace_back(link.first, link.second);
            neighbors[link.first].emplace_back(community, link.second);
        }
    }
    for (std::vector<WeightedEdge> &edges : neighbors) {
        std::sort(edges.begin(), edges.end());
    }
    level.graph = Graph(neighbors, self_loops);
    return level;
}

long num_communities(const Assignment &partition) {
    long result = 0;
    for (long community : partition) {
        if (community < 0) throw ValidationError("negative community id " + std::to_string(community));
        result = std::max(result, community + 1);
    }
    return result;
}

Assignment partition_at_level(const Dendrogram &dendrogram, long level) {
    if (level < 0 || level >= (long) dendrogram.size()) {
        throw ValidationError("level " + std::to_string(level) + " is outside of [0, "
                              + std::to_string(dendrogram.size()) + ")");
    }
    Assignment result = dendrogram[0];
    for (long index = 1; index <= level; ++index) {
        const Assignment &coarse = dendrogram[index];
        for (long &community : result) {
            community = coarse[community];
        }
    }
    return result;
}

Assignment renumber(const Assignment &assignment) {
    Assignment result(assignment.size());
    MapVector<long> new_ids;
    for (size_t vertex = 0; vertex < assignment.size(); ++vertex) {
        auto iterator = new_ids.find(assignment[vertex]);
        if (iterator == new_ids.end()) {
            long new_id = long(new_ids.size());
            new_ids[assignment[vertex]] = new_id;
            result[vertex] = new_id;
        } else {
            result[vertex] = iterator->second;
        }
    }
    return result;
}

}  // namespace aggregation
