#include "driver.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <omp.h>

#include "aggregation.hpp"
#include "estimation.hpp"
#include "exceptions.hpp"
#include "louvain.hpp"
#include "utils.hpp"

OptimizationDriver::OptimizationDriver(const Graph &graph, ModelType type, double initial_parameter,
                                       const Options &options, std::shared_ptr<IMinimizer> minimizer)
    : _graph(graph) {
    this->_model = model::make(type);
    if (!this->_model->is_valid(initial_parameter)) {
        throw ValidationError(this->_model->parameter_name(), initial_parameter, this->_model->domain());
    }
    if (minimizer == nullptr) {
        throw ConfigurationError("a minimizer is required");
    }
    this->_initial_parameter = initial_parameter;
    this->_options = options;
    this->_minimizer = minimizer;
}

Result OptimizationDriver::run() {
    double start_t = omp_get_wtime();
    this->initialize();
    while (this->_state != DriverState::Converged && this->_state != DriverState::Exhausted) {
        switch (this->_state) {
            case DriverState::PartitionPhase:
                this->partition_phase();
                break;
            case DriverState::ParameterPhase:
                this->parameter_phase();
                break;
            default:
                throw std::logic_error("optimization driver entered an unexpected state");
        }
    }
    this->_best.converged = this->_state == DriverState::Converged && this->_local_search_converged;
    this->_best.outer_iterations = this->_iteration;
    this->_best.parameter_clamped = this->_parameter_clamped;
    this->_best.runtime = omp_get_wtime() - start_t;
    if (this->_options.verbose) {
        std::cout << "Finished " << model::name(this->_model->type()) << " after " << this->_iteration
                  << " iterations (" << (this->_best.converged ? "converged" : "not converged") << "): "
                  << this->_best.num_communities << " communities, " << this->_best.parameter.name << " = "
                  << this->_best.parameter.value << ", log-likelihood = " << this->_best.log_likelihood << std::endl;
    }
    return this->_best;
}

void OptimizationDriver::initialize() {
    this->_state = DriverState::Initializing;
    this->_context = statistics::model_context(this->_graph);
    this->_generator = rng::generator(this->_options.seed);
    this->_parameter = this->_initial_parameter;
    this->_partition = utils::range<long>(0, this->_graph.num_vertices());
    this->_previous_partition = this->_partition;
    this->_seen_parameters = { this->_parameter };
    this->_iteration = 0;
    this->_local_search_converged = true;
    this->_parameter_clamped = false;
    this->_best = Result();
    this->_best.log_likelihood = -std::numeric_limits<double>::infinity();
    this->record(this->_parameter, this->_model->log_likelihood(
            statistics::compute(this->_graph, this->_partition, this->_context), this->_parameter));
    this->_state = DriverState::PartitionPhase;
}

void OptimizationDriver::parameter_phase() {
    double estimate = this->_parameter;
    try {
        estimation::Estimate result = estimation::estimate(this->_graph, this->_partition, *this->_model,
                                                           this->_context, *this->_minimizer, this->_parameter);
        estimate = result.value;
        this->_parameter_clamped = this->_parameter_clamped || result.clamped;
    } catch (const OptimizationError &error) {
        std::cerr << "WARNING: " << error.what() << "; keeping " << this->_model->parameter_name() << " = "
                  << this->_parameter << std::endl;
    }
    double log_likelihood = this->_model->log_likelihood(
            statistics::compute(this->_graph, this->_partition, this->_context), estimate);
    this->record(estimate, log_likelihood);
    if (this->_options.verbose) {
        std::cout << "Iteration: " << this->_iteration << ", communities: "
                  << aggregation::num_communities(this->_partition) << ", " << this->_model->parameter_name() << ": "
                  << this->_parameter << " -> " << estimate << ", log-likelihood: " << log_likelihood << std::endl;
    }
    bool unchanged = this->_partition == this->_previous_partition;
    bool stable = std::fabs(estimate - this->_parameter) <= this->_options.tolerance;
    bool cycle = std::find(this->_seen_parameters.begin(), this->_seen_parameters.end(), estimate)
                 != this->_seen_parameters.end();
    this->_parameter = estimate;
    this->_seen_parameters.push_back(estimate);
    if (unchanged || stable || cycle) {
        this->_state = DriverState::Converged;
    } else if (this->_iteration >= this->_options.max_outer_iterations) {
        this->_state = DriverState::Exhausted;
    } else {
        this->_state = DriverState::PartitionPhase;
    }
}

void OptimizationDriver::partition_phase() {
    if (this->_iteration >= this->_options.max_outer_iterations) {
        this->_state = DriverState::Exhausted;
        return;
    }
    this->_iteration++;
    louvain::DendrogramResult result = louvain::generate_dendrogram(this->_graph, *this->_model, this->_context,
                                                                    this->_parameter, this->_options,
                                                                    this->_generator);
    this->_local_search_converged = this->_local_search_converged && result.converged;
    this->_previous_partition = this->_partition;
    this->_partition = aggregation::flatten(result.dendrogram);
    this->_state = DriverState::ParameterPhase;
}

void OptimizationDriver::record(double parameter, double log_likelihood) {
    if (!(log_likelihood > this->_best.log_likelihood) && !this->_best.partition.empty()) return;
    this->_best.partition = this->_partition;
    this->_best.parameter.name = this->_model->parameter_name();
    this->_best.parameter.value = parameter;
    this->_best.log_likelihood = log_likelihood;
    this->_best.num_communities = aggregation::num_communities(this->_partition);
}
