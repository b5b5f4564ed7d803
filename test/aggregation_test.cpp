#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "aggregation.hpp"
#include "exceptions.hpp"
#include "louvain.hpp"
#include "model/dcppm.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "rng.hpp"
#include "statistics.hpp"
#include "utils.hpp"

#include "toy_example.hpp"

class AggregationTest : public ToyExample {
protected:
    Options options;
};

class BridgedCliques : public ::testing::Test {
protected:
    ModelContext context;
    Graph graph;
    Options options;
    void SetUp() override {
        graph = Graph(10);
        for (long block = 0; block < 2; ++block) {
            for (long i = 0; i < 5; ++i) {
                for (long j = i + 1; j < 5; ++j) {
                    graph.add_edge(5 * block + i, 5 * block + j);
                }
            }
        }
        graph.add_edge(4, 5);
        context = statistics::model_context(graph);
    }
};

TEST_F(AggregationTest, InducedLevelFoldsCommunitiesIntoVertices) {
    aggregation::Level level = aggregation::induced_level(graph, vertex_sizes, assignment);
    EXPECT_EQ(level.graph.num_vertices(), 3);
    EXPECT_EQ(level.graph.num_edges(), 6);  // three links and three self-loops
    EXPECT_DOUBLE_EQ(level.graph.total_weight(), 26.0);
    for (long community = 0; community < 3; ++community) {
        EXPECT_DOUBLE_EQ(level.graph.self_loop_weight(community), 7.0);
    }
    std::vector<WeightedEdge> expected { {1, 2.0}, {2, 1.0} };
    EXPECT_EQ(level.graph.neighbors(0), expected);
    expected = { {0, 1.0}, {1, 2.0} };
    EXPECT_EQ(level.graph.neighbors(2), expected);
    EXPECT_DOUBLE_EQ(level.graph.degree(0), 17.0);
    EXPECT_DOUBLE_EQ(level.graph.degree(1), 18.0);
    EXPECT_DOUBLE_EQ(level.graph.degree(2), 17.0);
    EXPECT_EQ(level.vertex_sizes, std::vector<long>({ 4, 3, 4 }));
}

TEST_F(AggregationTest, InducedLevelPreservesTheStatisticsOfThePartition) {
    aggregation::Level level = aggregation::induced_level(graph, vertex_sizes, assignment);
    PartitionStatistics fine = statistics::compute(graph, assignment, context);
    PartitionStatistics coarse = statistics::compute(level.graph, utils::range<long>(0, 3), context);
    EXPECT_DOUBLE_EQ(coarse.total_weight, fine.total_weight);
    EXPECT_DOUBLE_EQ(coarse.internal_weight, fine.internal_weight);
    EXPECT_DOUBLE_EQ(coarse.degrees_squared, fine.degrees_squared);
    EXPECT_EQ(coarse.community_degrees, fine.community_degrees);
    EXPECT_EQ(coarse.community_internals, fine.community_internals);
}

TEST_F(AggregationTest, InducedLevelRejectsWrongSizes) {
    EXPECT_THROW(aggregation::induced_level(graph, vertex_sizes, { 0, 1, 2 }), ValidationError);
}

TEST_F(AggregationTest, RenumberUsesOrderOfFirstAppearance) {
    EXPECT_EQ(aggregation::renumber({ 5, 5, 2, 7, 2 }), Assignment({ 0, 0, 1, 2, 1 }));
    EXPECT_EQ(aggregation::renumber({}), Assignment());
    EXPECT_EQ(aggregation::num_communities({ 0, 2, 1, 1 }), 3);
    EXPECT_THROW(aggregation::num_communities({ 0, -1 }), ValidationError);
}

TEST_F(AggregationTest, PartitionAtLevelComposesTheLevels) {
    Dendrogram dendrogram { { 0, 0, 1, 2, 2, 3 }, { 0, 1, 0, 1 }, { 0, 0 } };
    EXPECT_EQ(aggregation::partition_at_level(dendrogram, 0), Assignment({ 0, 0, 1, 2, 2, 3 }));
    EXPECT_EQ(aggregation::partition_at_level(dendrogram, 1), Assignment({ 0, 0, 1, 0, 0, 1 }));
    EXPECT_EQ(aggregation::partition_at_level(dendrogram, 2), Assignment({ 0, 0, 0, 0, 0, 0 }));
    EXPECT_THROW(aggregation::partition_at_level(dendrogram, 3), ValidationError);
    EXPECT_THROW(aggregation::partition_at_level(dendrogram, -1), ValidationError);
}

TEST_F(AggregationTest, FlattenReturnsTheTopLevel) {
    Dendrogram dendrogram { { 0, 0, 1, 2, 2, 3 }, { 0, 1, 0, 1 } };
    EXPECT_EQ(aggregation::flatten(dendrogram), Assignment({ 0, 0, 1, 0, 0, 1 }));
    EXPECT_EQ(aggregation::flatten({ { 1, 0, 1 } }), Assignment({ 1, 0, 1 }));
    EXPECT_THROW(aggregation::flatten(Dendrogram()), ValidationError);
}

TEST_F(AggregationTest, DendrogramLevelsAreCompactAndCoarsen) {
    for (ModelType type : { ModelType::PPM, ModelType::DCPPM, ModelType::ILFR, ModelType::ILFRs }) {
        std::unique_ptr<IQualityModel> model = model::make(type);
        rng::Gen generator = rng::generator(5);
        louvain::DendrogramResult result = louvain::generate_dendrogram(graph, *model, context,
                                                                        model->default_parameter(), options,
                                                                        generator);
        ASSERT_FALSE(result.dendrogram.empty());
        EXPECT_EQ((long) result.dendrogram[0].size(), graph.num_vertices());
        long previous_size = graph.num_vertices();
        for (const Assignment &level : result.dendrogram) {
            EXPECT_EQ((long) level.size(), previous_size) << model::name(type);
            EXPECT_EQ(level, aggregation::renumber(level)) << model::name(type);
            long communities = aggregation::num_communities(level);
            EXPECT_LE(communities, previous_size) << model::name(type);
            previous_size = communities;
        }
        Assignment top = aggregation::partition_at_level(result.dendrogram, long(result.dendrogram.size()) - 1);
        EXPECT_NEAR(result.quality, model->quality(statistics::compute(graph, top, context),
                                                   model->default_parameter()), 1e-9);
    }
}

TEST_F(AggregationTest, GraphWithoutEdgesGivesASingletonLevel) {
    Graph empty(4);
    ModelContext empty_context = statistics::model_context(empty);
    DCPPM model;
    rng::Gen generator = rng::generator(0);
    louvain::DendrogramResult result = louvain::generate_dendrogram(empty, model, empty_context, 1.0, options,
                                                                    generator);
    ASSERT_EQ(result.dendrogram.size(), size_t(1));
    EXPECT_EQ(result.dendrogram[0], Assignment({ 0, 1, 2, 3 }));
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.moves, 0);
}

TEST_F(BridgedCliques, LouvainSeparatesTheCliques) {
    DCPPM model;
    rng::Gen generator = rng::generator(9);
    Assignment partition = louvain::best_partition(graph, model, context, 1.0, options, generator);
    EXPECT_TRUE(same_communities(partition, { 0, 0, 0, 0, 0, 1, 1, 1, 1, 1 }));
    EXPECT_EQ(aggregation::num_communities(partition), 2);
}

TEST_F(BridgedCliques, WarmStartFromALocalOptimumMovesNothing) {
    DCPPM model;
    rng::Gen generator = rng::generator(2);
    Assignment cliques { 7, 7, 7, 7, 7, 3, 3, 3, 3, 3 };
    louvain::DendrogramResult result = louvain::generate_dendrogram(graph, model, context, 1.0, options, generator,
                                                                    cliques);
    ASSERT_EQ(result.dendrogram.size(), size_t(1));
    EXPECT_EQ(result.dendrogram[0], Assignment({ 0, 0, 0, 0, 0, 1, 1, 1, 1, 1 }));
    EXPECT_EQ(result.moves, 0);
    EXPECT_NEAR(result.quality, graph.modularity(cliques), 1e-12);
}

TEST_F(BridgedCliques, WarmStartRepairsAPoorPartition) {
    DCPPM model;
    rng::Gen generator = rng::generator(2);
    Assignment misplaced { 0, 0, 0, 0, 1, 1, 1, 1, 1, 0 };
    louvain::DendrogramResult result = louvain::generate_dendrogram(graph, model, context, 1.0, options, generator,
                                                                    misplaced);
    EXPECT_GT(result.moves, 0);
    EXPECT_TRUE(same_communities(aggregation::flatten(result.dendrogram), { 0, 0, 0, 0, 0, 1, 1, 1, 1, 1 }));
}

TEST_F(BridgedCliques, WarmStartRejectsInvalidPartitions) {
    DCPPM model;
    rng::Gen generator = rng::generator(2);
    EXPECT_THROW(louvain::generate_dendrogram(graph, model, context, 1.0, options, generator, { 0, 1 }),
                 ValidationError);
    Assignment negative = utils::constant<long>(10, 0);
    negative[3] = -2;
    EXPECT_THROW(louvain::generate_dendrogram(graph, model, context, 1.0, options, generator, negative),
                 ValidationError);
    Graph empty(3);
    ModelContext empty_context = statistics::model_context(empty);
    louvain::DendrogramResult result = louvain::generate_dendrogram(empty, model, empty_context, 1.0, options,
                                                                    generator, { 4, 4, 9 });
    ASSERT_EQ(result.dendrogram.size(), size_t(1));
    EXPECT_EQ(result.dendrogram[0], Assignment({ 0, 0, 1 }));
}
