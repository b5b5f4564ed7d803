#ifndef MLL_TEST_TOY_EXAMPLE_HPP
#define MLL_TEST_TOY_EXAMPLE_HPP

#include <vector>

#include <gtest/gtest.h>

#include "graph.hpp"
#include "statistics.hpp"
#include "typedefs.hpp"
#include "utils.hpp"

/// An 11-vertex weighted graph with self-loops on vertices 0, 5 and 10, and three communities.
class ToyExample : public ::testing::Test {
protected:
    Assignment assignment;
    ModelContext context;
    Graph graph;
    std::vector<long> vertex_sizes;
    void SetUp() override {
        std::vector<std::vector<double>> edges {
                {0, 0, 1},
                {0, 1, 2},
                {0, 2, 1},
                {1, 2, 1},
                {2, 3, 1},
                {3, 1, 1},
                {3, 5, 1},
                {4, 1, 1},
                {4, 6, 1},
                {5, 4, 1},
                {5, 5, 2},
                {5, 6, 3},
                {5, 7, 1},
                {7, 3, 1},
                {7, 9, 1},
                {8, 5, 1},
                {8, 7, 1},
                {9, 10, 2},
                {10, 7, 1},
                {10, 8, 1},
                {10, 10, 1}
        };
        graph = Graph(11);
        for (const std::vector<double> &edge : edges) {
            graph.add_edge(long(edge[0]), long(edge[1]), edge[2]);
        }
        assignment = { 0, 0, 0, 0, 1, 1, 1, 2, 2, 2, 2 };
        vertex_sizes = utils::constant<long>(11, 1);
        context = statistics::model_context(graph);
    }
};

/// Two disconnected triangles.
class TwoTriangles : public ::testing::Test {
protected:
    ModelContext context;
    Graph graph;
    void SetUp() override {
        graph = Graph(6);
        std::vector<std::vector<long>> edges { {0, 1}, {0, 2}, {1, 2}, {3, 4}, {3, 5}, {4, 5} };
        for (const std::vector<long> &edge : edges) {
            graph.add_edge(edge[0], edge[1]);
        }
        context = statistics::model_context(graph);
    }
};

/// Two 10-cliques joined by a perfect matching: p_in = 1 and p_out = 0.1.
class PlantedPartition : public ::testing::Test {
protected:
    ModelContext context;
    Graph graph;
    Assignment truth;
    void SetUp() override {
        graph = Graph(20);
        for (long block = 0; block < 2; ++block) {
            for (long i = 0; i < 10; ++i) {
                for (long j = i + 1; j < 10; ++j) {
                    graph.add_edge(10 * block + i, 10 * block + j);
                }
            }
        }
        for (long i = 0; i < 10; ++i) {
            graph.add_edge(i, i + 10);
        }
        truth = Assignment(20, 0);
        for (long vertex = 10; vertex < 20; ++vertex) {
            truth[vertex] = 1;
        }
        context = statistics::model_context(graph);
    }
};

/// Returns true if `partition` places the vertices of every group of `expected` together, and the vertices of
/// different groups apart.
inline bool same_communities(const Assignment &partition, const Assignment &expected) {
    if (partition.size() != expected.size()) return false;
    for (size_t i = 0; i < partition.size(); ++i) {
        for (size_t j = 0; j < partition.size(); ++j) {
            if ((partition[i] == partition[j]) != (expected[i] == expected[j])) return false;
        }
    }
    return true;
}

#endif // MLL_TEST_TOY_EXAMPLE_HPP
