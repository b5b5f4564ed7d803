#include "graph.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "exceptions.hpp"
#include "utils.hpp"

namespace {

/// Parses a 1-indexed vertex id.
long parse_vertex(const std::string &token) {
    try {
        long vertex = std::stol(token) - 1;  // Graph storage format indices vertices from 1, not 0
        if (vertex < 0) throw ValidationError("vertex ids must start at 1, found: " + token);
        return vertex;
    } catch (const std::logic_error &error) {
        throw ValidationError("could not parse vertex id: " + token);
    }
}

double parse_weight(const std::string &token) {
    try {
        return std::stod(token);
    } catch (const std::logic_error &error) {
        throw ValidationError("could not parse edge weight: " + token);
    }
}

}  // namespace

Graph::Graph(long num_vertices) {
    this->_num_vertices = num_vertices;
    this->_degrees = utils::constant<double>(num_vertices, 0.0);
    this->_self_loops = utils::constant<double>(num_vertices, 0.0);
    this->_neighbors = NeighborList(num_vertices);
}

Graph::Graph(NeighborList &neighbors, std::vector<double> &self_loops) {
    this->_num_vertices = long(neighbors.size());
    this->_neighbors = neighbors;
    this->_self_loops = self_loops;
    this->_degrees = utils::constant<double>(this->_num_vertices, 0.0);
    for (long vertex = 0; vertex < this->_num_vertices; ++vertex) {
        double loops = this->_self_loops[vertex];
        this->_degrees[vertex] += 2.0 * loops;
        this->_total_weight += loops;
        if (loops > 0.0) this->_num_edges++;
        for (const WeightedEdge &edge : this->_neighbors[vertex]) {
            this->_degrees[vertex] += edge.second;
            if (edge.first < vertex) continue;
            this->_total_weight += edge.second;
            this->_num_edges++;
        }
    }
}

void Graph::add_edge(long from, long to, double weight) {
    if (from < 0 || from >= this->_num_vertices || to < 0 || to >= this->_num_vertices) {
        throw ValidationError("edge (" + std::to_string(from) + ", " + std::to_string(to)
                              + ") references a vertex outside of [0, " + std::to_string(this->_num_vertices) + ")");
    }
    if (!(weight > 0.0) || !std::isfinite(weight)) {
        throw ValidationError("edge weight", weight, "(0, inf)");
    }
    this->_total_weight += weight;
    if (from == to) {
        if (this->_self_loops[from] == 0.0) this->_num_edges++;
        this->_self_loops[from] += weight;
        this->_degrees[from] += 2.0 * weight;
        return;
    }
    this->_degrees[from] += weight;
    this->_degrees[to] += weight;
    for (WeightedEdge &edge : this->_neighbors[from]) {
        if (edge.first != to) continue;
        edge.second += weight;
        for (WeightedEdge &reverse : this->_neighbors[to]) {
            if (reverse.first == from) {
                reverse.second += weight;
                break;
            }
        }
        return;
    }
    this->_neighbors[from].emplace_back(to, weight);
    this->_neighbors[to].emplace_back(from, weight);
    this->_num_edges++;
}

bool Graph::has_edge(long from, long to) const {
    if (from == to) return this->_self_loops[from] > 0.0;
    for (const WeightedEdge &edge : this->_neighbors[from]) {
        if (edge.first == to) return true;
    }
    return false;
}

Graph Graph::load(const fs::path &filepath) {
    std::vector<std::vector<std::string>> csv_contents = utils::read_csv(filepath);
    if (csv_contents.empty()) {
        throw ValidationError("could not read any edges from " + filepath.string());
    }
    Graph graph;
    if (csv_contents[0][0] == "%%MatrixMarket") {
        graph = Graph::load_matrix_market(csv_contents);
    } else {
        graph = Graph::load_text(csv_contents);
    }
    std::cout << "V: " << graph.num_vertices() << " E: " << graph.num_edges() << " W: " << graph.total_weight()
              << std::endl;
    return graph;
}

Graph Graph::load_matrix_market(const std::vector<std::vector<std::string>> &csv_contents) {
    const std::vector<std::string> &header = csv_contents[0];
    if (header.size() < 5 || header[2] != "coordinate") {
        throw ValidationError("dense matrices are not supported");
    }
    bool weighted = header[3] != "pattern";
    // Find index at which edges start
    size_t index = csv_contents.size();
    long num_vertices = 0;
    for (size_t i = 1; i < csv_contents.size(); ++i) {
        const std::vector<std::string> &line = csv_contents[i];
        if (line[0][0] == '%') continue;
        if (line.size() < 3) throw ValidationError("malformed matrix market size line");
        num_vertices = std::stol(line[0]);
        if (num_vertices != std::stol(line[1])) {
            throw ValidationError("rectangular matrices are not supported");
        }
        index = i + 1;
        break;
    }
    Graph graph(num_vertices);
    for (size_t i = index; i < csv_contents.size(); ++i) {
        const std::vector<std::string> &edge = csv_contents[i];
        if (edge[0][0] == '%') continue;
        if (edge.size() < 2) throw ValidationError("malformed matrix market entry on line " + std::to_string(i + 1));
        long from = parse_vertex(edge[0]);
        long to = parse_vertex(edge[1]);
        double weight = (weighted && edge.size() > 2) ? parse_weight(edge[2]) : 1.0;
        if (graph.has_edge(from, to)) continue;
        graph.add_edge(from, to, weight);
    }
    return graph;
}

Graph Graph::load_text(const std::vector<std::vector<std::string>> &csv_contents) {
    long num_vertices = 0;
    for (const std::vector<std::string> &edge : csv_contents) {
        if (edge.size() < 2) throw ValidationError("every edge line needs at least two vertex ids");
        long from = parse_vertex(edge[0]);
        long to = parse_vertex(edge[1]);
        num_vertices = (from + 1 > num_vertices) ? from + 1 : num_vertices;
        num_vertices = (to + 1 > num_vertices) ? to + 1 : num_vertices;
    }
    Graph graph(num_vertices);
    for (const std::vector<std::string> &edge : csv_contents) {
        long from = parse_vertex(edge[0]);
        long to = parse_vertex(edge[1]);
        double weight = (edge.size() > 2) ? parse_weight(edge[2]) : 1.0;
        if (graph.has_edge(from, to)) continue;
        graph.add_edge(from, to, weight);
    }
    return graph;
}

double Graph::modularity(const Assignment &assignment) const {
    if (this->_total_weight == 0.0) {
        throw ValidationError("modularity is undefined for a graph without edges");
    }
    if ((long) assignment.size() != this->_num_vertices) {
        throw ValidationError("assignment has " + std::to_string(assignment.size()) + " entries, graph has "
                              + std::to_string(this->_num_vertices) + " vertices");
    }
    // Q = sum_c [ in_c / E - (D_c / 2E)^2 ]
    MapVector<double> internal;
    MapVector<double> community_degree;
    for (long vertex = 0; vertex < this->_num_vertices; ++vertex) {
        long community = assignment[vertex];
        community_degree[community] += this->_degrees[vertex];
        internal[community] += this->_self_loops[vertex];
        for (const WeightedEdge &edge : this->_neighbors[vertex]) {
            if (edge.first < vertex || assignment[edge.first] != community) continue;
            internal[community] += edge.second;
        }
    }
    double result = 0.0;
    for (const auto &entry : community_degree) {
        double fraction = entry.second / (2.0 * this->_total_weight);
        result += map_vector::get(internal, entry.first) / this->_total_weight - fraction * fraction;
    }
    return result;
}
