/**
 * Community detection by likelihood maximization: the entry points of the library.
 */
#ifndef MLL_MLL_HPP
#define MLL_MLL_HPP

#include <map>
#include <memory>
#include <string>

#include "driver.hpp"
#include "graph.hpp"
#include "minimizer.hpp"
#include "model/quality_model.hpp"
#include "options.hpp"
#include "typedefs.hpp"

namespace mll {

/// Parameter values keyed by name ("gamma" or "mu"). Missing parameters take the model's default; parameters of
/// other models are ignored.
typedef std::map<std::string, double> ParameterMap;

/// Finds the partition of `graph`, and the parameter of `model` ("ppm", "dcppm", "ilfr" or "ilfrs"), that maximize
/// the likelihood of the graph. Throws a ConfigurationError for an unknown model, and a ValidationError for a
/// parameter outside of its domain. A null `minimizer` selects BrentMinimizer.
Result best_partition(const Graph &graph, const std::string &model, const ParameterMap &initial_parameters = {},
                      const Options &options = Options(), std::shared_ptr<IMinimizer> minimizer = nullptr);

/// Returns the log-likelihood of `graph` given `partition` under `model`.
double total_log_likelihood(const Graph &graph, const Assignment &partition, const std::string &model,
                            const ParameterMap &parameters = {});

/// Returns the maximum likelihood parameter of `model` for a fixed `partition`, clamped into its domain.
Parameter estimate_parameter(const Graph &graph, const Assignment &partition, const std::string &model);

}  // namespace mll

#endif // MLL_MLL_HPP
