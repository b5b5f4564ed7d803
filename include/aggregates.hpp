/***
 * Per-community aggregates of one level of the community hierarchy.
 */
#ifndef MLL_AGGREGATES_HPP
#define MLL_AGGREGATES_HPP

#include <vector>

#include "graph.hpp"
#include "typedefs.hpp"

/// The communities adjacent to a vertex, and the total weight of the edges linking the vertex to each of them.
typedef struct neighbor_communities_t {
    /// Adjacent communities, in the order in which they were encountered
    std::vector<long> communities;
    MapVector<double> weights;
    double weight(long community) const { return map_vector::get(this->weights, community); }
} NeighborCommunities;

/// Stores, for every community of a level, its total weighted degree, its internal weight (intra-community edges
/// counted once, plus the self-loops of its members) and its size in original vertices. Moving a vertex costs
/// O(degree) and keeps every aggregate exact.
///
/// The aggregates keep a pointer to the graph of the level, which must outlive them.
class CommunityAggregates {
public:
    CommunityAggregates() = default;
    /// Places every vertex of `graph` in its own community.
    CommunityAggregates(const Graph &graph, const std::vector<long> &vertex_sizes);
    /// Builds the aggregates of `assignment`. Community ids must lie in [0, graph.num_vertices()).
    CommunityAggregates(const Graph &graph, const std::vector<long> &vertex_sizes, const Assignment &assignment);
    //============================================
    // GETTERS
    //============================================
    /// Returns an immutable reference to the vertex-to-community assignment vector.
    const Assignment &assignment() const { return this->_assignment; }
    /// Returns the community of `vertex`, or -1 while the vertex is removed.
    long community(long vertex) const { return this->_assignment[vertex]; }
    /// Returns the total weighted degree of `community`.
    double degree(long community) const { return this->_degrees[community]; }
    const Graph &graph() const { return *this->_graph; }
    /// Returns the internal weight of `community`.
    double internal_weight(long community) const { return this->_internals[community]; }
    /// Returns the number of non-empty communities.
    long num_communities() const { return this->_num_communities; }
    /// Returns the number of original vertices the level stands for.
    long num_original_vertices() const { return this->_num_original_vertices; }
    /// Returns the number of original vertices in `community`.
    long size(long community) const { return this->_sizes[community]; }
    double vertex_degree(long vertex) const { return this->_graph->degree(vertex); }
    double vertex_loops(long vertex) const { return this->_graph->self_loop_weight(vertex); }
    long vertex_size(long vertex) const { return this->_vertex_sizes[vertex]; }
    //============================================
    // UPDATES
    //============================================
    /// Inserts the removed `vertex` into `community`, given the weight of the edges linking them.
    void insert(long vertex, long community, double weight_to_community);
    /// Moves `vertex` into `community`, computing the link weights from the graph.
    void move_vertex(long vertex, long community);
    /// Collects the communities adjacent to `vertex` and the weights linking it to them, in O(degree).
    NeighborCommunities neighbor_communities(long vertex) const;
    /// Removes `vertex` from its community, given the weight of the edges linking them (self-loops excluded).
    void remove(long vertex, double weight_to_community);
    /// Recomputes every aggregate from scratch and returns true if they match the incrementally updated ones.
    bool validate() const;
private:
    Assignment _assignment;
    std::vector<double> _degrees;
    const Graph *_graph = nullptr;
    std::vector<double> _internals;
    long _num_communities = 0;
    long _num_original_vertices = 0;
    std::vector<long> _sizes;
    std::vector<long> _vertex_sizes;
};

#endif // MLL_AGGREGATES_HPP
