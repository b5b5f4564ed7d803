/***
 * Stores a weighted, undirected Graph.
 */
#ifndef MLL_GRAPH_HPP
#define MLL_GRAPH_HPP

#include <string>
#include <vector>

#include "fs.hpp"
#include "typedefs.hpp"

/// Vertices are numbered 0..num_vertices-1. Every non-loop edge is stored in the neighbor lists of both of its
/// endpoints; self-loops are stored separately. A self-loop of weight w adds 2w to the degree of its vertex, so that
/// the degrees always sum to 2 * total_weight().
class Graph {
public:
    explicit Graph(long num_vertices);
    /// Builds a graph from prepared, symmetric neighbor lists that hold no self-loops and no repeated neighbors.
    Graph(NeighborList &neighbors, std::vector<double> &self_loops);
    Graph() = default;
    /// Loads the graph stored at `filepath`, either as a Matrix Market file or as a text file of
    /// "from to [weight]" lines. Vertex ids in the file start at 1. Repeated edges are ignored.
    static Graph load(const fs::path &filepath);
    /// Loads the graph if it's in a matrix market format.
    static Graph load_matrix_market(const std::vector<std::vector<std::string>> &csv_contents);
    /// Loads the graph if it's in a text format: a list of "from to [weight]" string tuples.
    static Graph load_text(const std::vector<std::vector<std::string>> &csv_contents);
    //============================================
    // GETTERS & SETTERS
    //============================================
    /// Adds an undirected edge to the graph. If the edge already exists, its weight is increased by `weight`.
    void add_edge(long from, long to, double weight = 1.0);
    /// Returns the weighted degree of vertex `v`
    double degree(long v) const { return this->_degrees[v]; }
    /// Returns a const reference to the weighted degrees of every vertex
    const std::vector<double> &degrees() const { return this->_degrees; }
    /// Returns true if there is an edge between `from` and `to`
    bool has_edge(long from, long to) const;
    /// Calculates the (Newman-Girvan) modularity of this graph given a vertex-to-community `assignment`
    double modularity(const Assignment &assignment) const;
    /// Returns a const reference to the neighbors
    const NeighborList &neighbors() const { return this->_neighbors; }
    /// Returns a const reference to the (neighbor, weight) pairs of vertex `v`, excluding self-loops
    const std::vector<WeightedEdge> &neighbors(long v) const { return this->_neighbors[v]; }
    /// Returns the number of distinct edges in this graph, self-loops included
    long num_edges() const { return this->_num_edges; }
    /// Returns the number of vertices in this graph
    long num_vertices() const { return this->_num_vertices; }
    /// Returns the weight of the self-loop on vertex `v`
    double self_loop_weight(long v) const { return this->_self_loops[v]; }
    /// Returns the sum of edge weights, counting every edge once
    double total_weight() const { return this->_total_weight; }
private:
    /// The weighted degree of every vertex
    std::vector<double> _degrees;
    /// For every vertex, stores the (neighbor, weight) pairs
    NeighborList _neighbors;
    /// The number of vertices in the graph
    long _num_vertices = 0;
    /// The number of edges in the graph
    long _num_edges = 0;
    /// The self-loop weight of every vertex
    std::vector<double> _self_loops;
    /// The sum of all edge weights
    double _total_weight = 0.0;
};

#endif // MLL_GRAPH_HPP
