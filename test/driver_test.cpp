#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "driver.hpp"
#include "exceptions.hpp"
#include "minimizer.hpp"
#include "mll.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "utils.hpp"

#include "toy_example.hpp"

/// Fails on every call, the way a minimizer that wanders off into NaN would.
class NaNMinimizer : public IMinimizer {
public:
    double minimize(const std::function<double(double)> & /* objective */, double /* lower */,
                    double /* upper */) const override {
        return std::numeric_limits<double>::quiet_NaN();
    }
};

const std::vector<std::string> MODELS { "ppm", "dcppm", "ilfr", "ilfrs" };

class DriverTest : public TwoTriangles {
protected:
    Options options;
};

class DriverPlantedTest : public PlantedPartition {
protected:
    Options options;
};

TEST_F(DriverTest, EveryModelFindsTheTriangles) {
    for (const std::string &model : MODELS) {
        Result result = mll::best_partition(graph, model, {}, options);
        EXPECT_TRUE(same_communities(result.partition, { 0, 0, 0, 1, 1, 1 })) << model;
        EXPECT_EQ(result.num_communities, 2) << model;
        EXPECT_TRUE(std::isfinite(result.log_likelihood)) << model;
        EXPECT_GE(result.outer_iterations, 1) << model;
    }
}

TEST_F(DriverTest, ResultLikelihoodMatchesTheEvaluation) {
    for (const std::string &model : MODELS) {
        Result result = mll::best_partition(graph, model, {}, options);
        mll::ParameterMap parameters { { result.parameter.name, result.parameter.value } };
        EXPECT_NEAR(result.log_likelihood, mll::total_log_likelihood(graph, result.partition, model, parameters),
                    1e-9) << model;
    }
}

TEST_F(DriverTest, GraphWithoutEdgesKeepsSingletons) {
    Graph empty(5);
    for (const std::string &model : MODELS) {
        Result result = mll::best_partition(empty, model, {}, options);
        EXPECT_EQ(result.partition, Assignment({ 0, 1, 2, 3, 4 })) << model;
        EXPECT_TRUE(std::isfinite(result.log_likelihood)) << model;
        EXPECT_TRUE(result.converged) << model;
        EXPECT_EQ(result.outer_iterations, 1) << model;
    }
    Graph nothing(0);
    Result result = mll::best_partition(nothing, "dcppm", {}, options);
    EXPECT_TRUE(result.partition.empty());
    EXPECT_EQ(result.num_communities, 0);
}

TEST_F(DriverTest, EqualSeedsGiveEqualResults) {
    options.seed = 1234;
    Result first = mll::best_partition(graph, "ilfr", {}, options);
    Result second = mll::best_partition(graph, "ilfr", {}, options);
    EXPECT_EQ(first.partition, second.partition);
    EXPECT_DOUBLE_EQ(first.parameter.value, second.parameter.value);
    EXPECT_DOUBLE_EQ(first.log_likelihood, second.log_likelihood);
}

TEST_F(DriverTest, InvalidConfigurationsAreRejected) {
    EXPECT_THROW(mll::best_partition(graph, "modularity", {}, options), ConfigurationError);
    EXPECT_THROW(mll::best_partition(graph, "ppm", { { "gamma", 0.0 } }, options), ValidationError);
    EXPECT_THROW(mll::best_partition(graph, "dcppm", { { "gamma", -1.0 } }, options), ValidationError);
    EXPECT_THROW(mll::best_partition(graph, "ilfrs", { { "mu", 1.5 } }, options), ValidationError);
    EXPECT_THROW(OptimizationDriver(graph, ModelType::ILFR, 0.0, options), ValidationError);
    EXPECT_THROW(OptimizationDriver(graph, ModelType::PPM, 1.0, options, nullptr), ConfigurationError);
}

TEST_F(DriverTest, FailedEstimationKeepsThePreviousParameter) {
    OptimizationDriver driver(graph, ModelType::ILFR, 0.5, options, std::make_shared<NaNMinimizer>());
    Result result = driver.run();
    EXPECT_DOUBLE_EQ(result.parameter.value, 0.5);
    EXPECT_EQ(result.parameter.name, "mu");
    EXPECT_TRUE(same_communities(result.partition, { 0, 0, 0, 1, 1, 1 }));
}

TEST_F(DriverTest, IterationLimitStopsTheRun) {
    options.max_outer_iterations = 1;
    OptimizationDriver driver(graph, ModelType::DCPPM, 1.0, options);
    EXPECT_EQ(driver.state(), DriverState::Initializing);
    Result result = driver.run();
    EXPECT_EQ(driver.state(), DriverState::Exhausted);
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.outer_iterations, 1);
    EXPECT_EQ(result.num_communities, 2);
}

TEST_F(DriverTest, ClampedEstimatesAreReported) {
    // Disconnected triangles leave no external weight, so mu = Eout / E = 0 lies outside of (0, 1)
    Result result = mll::best_partition(graph, "ilfrs", {}, options);
    EXPECT_TRUE(result.parameter_clamped);
    result = mll::best_partition(graph, "ppm", {}, options);
    EXPECT_FALSE(result.parameter_clamped);
}

TEST_F(DriverTest, RunsCanBeRepeated) {
    OptimizationDriver driver(graph, ModelType::PPM, 1.0, options);
    Result first = driver.run();
    EXPECT_EQ(driver.state(), DriverState::Converged);
    Result second = driver.run();
    EXPECT_EQ(first.partition, second.partition);
    EXPECT_DOUBLE_EQ(first.parameter.value, second.parameter.value);
    EXPECT_EQ(first.outer_iterations, second.outer_iterations);
}

TEST_F(DriverPlantedTest, EveryModelFindsThePlantedPartition) {
    for (const std::string &model : MODELS) {
        Result result = mll::best_partition(graph, model, {}, options);
        EXPECT_TRUE(same_communities(result.partition, truth)) << model;
        EXPECT_TRUE(result.converged) << model;
        EXPECT_GE(result.log_likelihood, mll::total_log_likelihood(graph, truth, model,
                                                                   { { result.parameter.name,
                                                                       result.parameter.value } }) - 1e-9) << model;
    }
}

TEST_F(DriverPlantedTest, ILFRsSettlesOnTheExternalFraction) {
    Result result = mll::best_partition(graph, "ilfrs", { { "mu", 0.5 } }, options);
    EXPECT_NEAR(result.parameter.value, 0.1, 1e-9);
    EXPECT_FALSE(result.parameter_clamped);
}
