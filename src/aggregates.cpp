#include "aggregates.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

#include "exceptions.hpp"
#include "utils.hpp"

CommunityAggregates::CommunityAggregates(const Graph &graph, const std::vector<long> &vertex_sizes)
    : CommunityAggregates(graph, vertex_sizes, utils::range<long>(0, graph.num_vertices())) {}

CommunityAggregates::CommunityAggregates(const Graph &graph, const std::vector<long> &vertex_sizes,
                                         const Assignment &assignment) {
    long num_vertices = graph.num_vertices();
    if ((long) vertex_sizes.size() != num_vertices || (long) assignment.size() != num_vertices) {
        throw ValidationError("expected " + std::to_string(num_vertices) + " vertex sizes and assignments, found "
                              + std::to_string(vertex_sizes.size()) + " and " + std::to_string(assignment.size()));
    }
    this->_graph = &graph;
    this->_vertex_sizes = vertex_sizes;
    this->_assignment = utils::constant<long>(num_vertices, -1);
    this->_degrees = utils::constant<double>(num_vertices, 0.0);
    this->_internals = utils::constant<double>(num_vertices, 0.0);
    this->_sizes = utils::constant<long>(num_vertices, 0);
    this->_num_original_vertices = utils::sum<long>(vertex_sizes);
    for (long vertex = 0; vertex < num_vertices; ++vertex) {
        long community = assignment[vertex];
        if (community < 0 || community >= num_vertices) {
            throw ValidationError("community id " + std::to_string(community) + " of vertex " + std::to_string(vertex)
                                  + " is outside of [0, " + std::to_string(num_vertices) + ")");
        }
        double weight_to_community = 0.0;
        for (const WeightedEdge &edge : graph.neighbors(vertex)) {
            if (this->_assignment[edge.first] == community) weight_to_community += edge.second;
        }
        this->insert(vertex, community, weight_to_community);
    }
}

void CommunityAggregates::insert(long vertex, long community, double weight_to_community) {
    this->_assignment[vertex] = community;
    if (this->_sizes[community] == 0) this->_num_communities++;
    this->_sizes[community] += this->_vertex_sizes[vertex];
    this->_degrees[community] += this->vertex_degree(vertex);
    this->_internals[community] += weight_to_community + this->vertex_loops(vertex);
}

void CommunityAggregates::move_vertex(long vertex, long community) {
    long current = this->_assignment[vertex];
    if (current == community) return;
    double weight_from = 0.0;
    double weight_to = 0.0;
    for (const WeightedEdge &edge : this->_graph->neighbors(vertex)) {
        long neighbor_community = this->_assignment[edge.first];
        if (neighbor_community == current) weight_from += edge.second;
        if (neighbor_community == community) weight_to += edge.second;
    }
    this->remove(vertex, weight_from);
    this->insert(vertex, community, weight_to);
}

NeighborCommunities CommunityAggregates::neighbor_communities(long vertex) const {
    NeighborCommunities result;
    for (const WeightedEdge &edge : this->_graph->neighbors(vertex)) {
        long community = this->_assignment[edge.first];
        auto iterator = result.weights.find(community);
        if (iterator == result.weights.end()) {
            result.communities.push_back(community);
            result.weights[community] = edge.second;
        } else {
            iterator.value() += edge.second;
        }
    }
    return result;
}

void CommunityAggregates::remove(long vertex, double weight_to_community) {
    long community = this->_assignment[vertex];
    this->_sizes[community] -= this->_vertex_sizes[vertex];
    if (this->_sizes[community] == 0) {
        this->_num_communities--;
        // Reset exactly, so that rounding errors do not accumulate in empty communities
        this->_degrees[community] = 0.0;
        this->_internals[community] = 0.0;
    } else {
        this->_degrees[community] -= this->vertex_degree(vertex);
        this->_internals[community] -= weight_to_community + this->vertex_loops(vertex);
    }
    this->_assignment[vertex] = -1;
}

bool CommunityAggregates::validate() const {
    long num_vertices = this->_graph->num_vertices();
    std::vector<double> degrees = utils::constant<double>(num_vertices, 0.0);
    std::vector<double> internals = utils::constant<double>(num_vertices, 0.0);
    std::vector<long> sizes = utils::constant<long>(num_vertices, 0);
    for (long vertex = 0; vertex < num_vertices; ++vertex) {
        long community = this->_assignment[vertex];
        if (community < 0) {
            std::cerr << "ERROR " << "vertex " << vertex << " is not assigned to any community" << std::endl;
            return false;
        }
        degrees[community] += this->vertex_degree(vertex);
        internals[community] += this->vertex_loops(vertex);
        sizes[community] += this->_vertex_sizes[vertex];
        for (const WeightedEdge &edge : this->_graph->neighbors(vertex)) {
            if (edge.first > vertex && this->_assignment[edge.first] == community) internals[community] += edge.second;
        }
    }
    double tolerance = 1e-9 * std::max(1.0, this->_graph->total_weight());
    double total_degree = 0.0;
    double total_internal = 0.0;
    long num_communities = 0;
    for (long community = 0; community < num_vertices; ++community) {
        if (sizes[community] != this->_sizes[community]) return false;
        if (std::fabs(degrees[community] - this->_degrees[community]) > tolerance) return false;
        if (std::fabs(internals[community] - this->_internals[community]) > tolerance) return false;
        if (sizes[community] > 0) num_communities++;
        total_degree += this->_degrees[community];
        total_internal += this->_internals[community];
    }
    if (num_communities != this->_num_communities) return false;
    if (std::fabs(total_degree - 2.0 * this->_graph->total_weight()) > tolerance) return false;
    return total_internal <= this->_graph->total_weight() + tolerance;
}
