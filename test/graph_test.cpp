#include <vector>

#include <gtest/gtest.h>

#include "exceptions.hpp"
#include "graph.hpp"
#include "utils.hpp"

#include "toy_example.hpp"

class GraphTest : public ToyExample {
};

TEST_F(GraphTest, SetUpWorksCorrectly) {
    EXPECT_EQ(graph.num_vertices(), 11);
    EXPECT_EQ(graph.num_edges(), 21);
    EXPECT_DOUBLE_EQ(graph.total_weight(), 26.0);
    EXPECT_EQ(graph.neighbors().size(), 11);
}

TEST_F(GraphTest, DegreesCountSelfLoopsTwice) {
    EXPECT_DOUBLE_EQ(graph.degree(0), 5.0);
    EXPECT_DOUBLE_EQ(graph.degree(5), 11.0);
    EXPECT_DOUBLE_EQ(graph.degree(10), 6.0);
    EXPECT_DOUBLE_EQ(graph.self_loop_weight(5), 2.0);
    EXPECT_DOUBLE_EQ(graph.self_loop_weight(4), 0.0);
    EXPECT_DOUBLE_EQ(utils::sum<double>(graph.degrees()), 2.0 * graph.total_weight());
}

TEST_F(GraphTest, NeighborListsAreSymmetric) {
    for (long vertex = 0; vertex < graph.num_vertices(); ++vertex) {
        for (const WeightedEdge &edge : graph.neighbors(vertex)) {
            EXPECT_NE(edge.first, vertex);
            EXPECT_TRUE(graph.has_edge(edge.first, vertex));
        }
    }
    EXPECT_TRUE(graph.has_edge(5, 5));
    EXPECT_FALSE(graph.has_edge(4, 4));
    EXPECT_FALSE(graph.has_edge(0, 10));
}

TEST_F(GraphTest, AddingAnExistingEdgeAccumulatesItsWeight) {
    Graph small(3);
    small.add_edge(0, 1);
    small.add_edge(1, 0, 2.5);
    EXPECT_EQ(small.num_edges(), 1);
    EXPECT_EQ(small.neighbors(0).size(), 1);
    EXPECT_DOUBLE_EQ(small.neighbors(0)[0].second, 3.5);
    EXPECT_DOUBLE_EQ(small.neighbors(1)[0].second, 3.5);
    EXPECT_DOUBLE_EQ(small.total_weight(), 3.5);
    EXPECT_DOUBLE_EQ(small.degree(2), 0.0);
}

TEST_F(GraphTest, InvalidEdgesAreRejected) {
    Graph small(3);
    EXPECT_THROW(small.add_edge(0, 1, 0.0), ValidationError);
    EXPECT_THROW(small.add_edge(0, 1, -1.0), ValidationError);
    EXPECT_THROW(small.add_edge(0, 3), ValidationError);
    EXPECT_THROW(small.add_edge(-1, 2), ValidationError);
    EXPECT_EQ(small.num_edges(), 0);
}

TEST_F(GraphTest, ModularityIsCorrectlyComputed) {
    // Every community has 7 internal weight; community degrees are 17, 18 and 17
    EXPECT_NEAR(graph.modularity(assignment), 21.0 / 26.0 - 902.0 / 2704.0, 1e-12);
    EXPECT_NEAR(graph.modularity(utils::constant<long>(11, 0)), 0.0, 1e-12);
    EXPECT_THROW(Graph(4).modularity(utils::constant<long>(4, 0)), ValidationError);
}

TEST_F(GraphTest, TextGraphsAreLoaded) {
    std::vector<std::vector<std::string>> contents {
            {"1", "2"},
            {"2", "3", "2.5"},
            {"2", "1"},
            {"4", "4", "3"}
    };
    Graph loaded = Graph::load_text(contents);
    EXPECT_EQ(loaded.num_vertices(), 4);
    EXPECT_EQ(loaded.num_edges(), 3);
    EXPECT_DOUBLE_EQ(loaded.total_weight(), 6.5);
    EXPECT_DOUBLE_EQ(loaded.self_loop_weight(3), 3.0);
}

TEST_F(GraphTest, MatrixMarketGraphsAreLoaded) {
    std::vector<std::vector<std::string>> contents {
            {"%%MatrixMarket", "matrix", "coordinate", "pattern", "symmetric"},
            {"%", "a", "comment"},
            {"3", "3", "2"},
            {"1", "2"},
            {"3", "3"}
    };
    Graph loaded = Graph::load_matrix_market(contents);
    EXPECT_EQ(loaded.num_vertices(), 3);
    EXPECT_EQ(loaded.num_edges(), 2);
    EXPECT_DOUBLE_EQ(loaded.total_weight(), 2.0);
    EXPECT_DOUBLE_EQ(loaded.degree(2), 2.0);
}

TEST_F(GraphTest, MalformedFilesAreRejected) {
    std::vector<std::vector<std::string>> text { {"1", "two"} };
    EXPECT_THROW(Graph::load_text(text), ValidationError);
    std::vector<std::vector<std::string>> zero { {"0", "1"} };
    EXPECT_THROW(Graph::load_text(zero), ValidationError);
    std::vector<std::vector<std::string>> dense { {"%%MatrixMarket", "matrix", "array", "real", "general"} };
    EXPECT_THROW(Graph::load_matrix_market(dense), ValidationError);
}

TEST_F(GraphTest, PreparedNeighborListsBuildTheSameGraph) {
    NeighborList neighbors = graph.neighbors();
    std::vector<double> self_loops;
    for (long vertex = 0; vertex < graph.num_vertices(); ++vertex) {
        self_loops.push_back(graph.self_loop_weight(vertex));
    }
    Graph copy(neighbors, self_loops);
    EXPECT_EQ(copy.num_vertices(), graph.num_vertices());
    EXPECT_EQ(copy.num_edges(), graph.num_edges());
    EXPECT_DOUBLE_EQ(copy.total_weight(), graph.total_weight());
    for (long vertex = 0; vertex < graph.num_vertices(); ++vertex) {
        EXPECT_DOUBLE_EQ(copy.degree(vertex), graph.degree(vertex));
    }
}
