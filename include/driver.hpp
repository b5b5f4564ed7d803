/**
 * Alternates between optimizing the partition for a fixed parameter and re-estimating the parameter for the fixed
 * partition, until neither changes.
 */
#ifndef MLL_DRIVER_HPP
#define MLL_DRIVER_HPP

#include <memory>
#include <vector>

#include "graph.hpp"
#include "minimizer.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "rng.hpp"
#include "statistics.hpp"
#include "typedefs.hpp"

enum class DriverState { Initializing, PartitionPhase, ParameterPhase, Converged, Exhausted };

typedef struct result_t {
    Assignment partition;
    Parameter parameter;
    double log_likelihood = 0.0;
    /// True if the outer loop reached a fixed point and every local search reached a local optimum
    bool converged = false;
    long outer_iterations = 0;
    /// True if some re-estimated parameter fell outside of the model's domain and was clamped
    bool parameter_clamped = false;
    long num_communities = 0;
    /// Wall time of the run, in seconds
    double runtime = 0.0;
} Result;

/// Runs the alternating optimization on one graph. The driver owns the model, the random generator and every
/// intermediate partition; the graph must outlive it. Of all (partition, parameter) pairs visited, the one with the
/// highest log-likelihood is returned.
class OptimizationDriver {
public:
    /// Throws a ValidationError if `initial_parameter` lies outside of the model's domain.
    OptimizationDriver(const Graph &graph, ModelType type, double initial_parameter, const Options &options,
                       std::shared_ptr<IMinimizer> minimizer = std::make_shared<BrentMinimizer>());
    /// Runs the optimization to completion. May be called again, with identical results.
    Result run();
    DriverState state() const { return this->_state; }
private:
    Result _best;
    const Graph &_graph;
    double _initial_parameter;
    long _iteration = 0;
    bool _local_search_converged = true;
    bool _parameter_clamped = false;
    std::shared_ptr<IMinimizer> _minimizer;
    std::unique_ptr<IQualityModel> _model;
    ModelContext _context;
    rng::Gen _generator;
    Options _options;
    double _parameter = 0.0;
    Assignment _partition;
    Assignment _previous_partition;
    std::vector<double> _seen_parameters;
    DriverState _state = DriverState::Initializing;
    /// Starts from the all-singleton partition and the initial parameter.
    void initialize();
    /// Re-estimates the parameter, scores the partition and decides whether to stop.
    void parameter_phase();
    /// Optimizes the partition under the current parameter.
    void partition_phase();
    /// Keeps the (partition, parameter) pair if it is the most likely one so far.
    void record(double parameter, double log_likelihood);
};

#endif // MLL_DRIVER_HPP
