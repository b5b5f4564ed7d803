#include "mll.hpp"

#include "estimation.hpp"
#include "exceptions.hpp"
#include "likelihood.hpp"
#include "statistics.hpp"

namespace mll {

namespace {

/// Looks up the parameter of `model` in `parameters` and checks its domain.
double resolve_parameter(const IQualityModel &model, const ParameterMap &parameters) {
    auto iterator = parameters.find(model.parameter_name());
    if (iterator == parameters.end()) return model.default_parameter();
    if (!model.is_valid(iterator->second)) {
        throw ValidationError(model.parameter_name(), iterator->second, model.domain());
    }
    return iterator->second;
}

}  // namespace

Result best_partition(const Graph &graph, const std::string &model, const ParameterMap &initial_parameters,
                      const Options &options, std::shared_ptr<IMinimizer> minimizer) {
    ModelType type = model::parse(model);
    double parameter = resolve_parameter(*model::make(type), initial_parameters);
    if (minimizer == nullptr) minimizer = std::make_shared<BrentMinimizer>();
    OptimizationDriver driver(graph, type, parameter, options, minimizer);
    return driver.run();
}

double total_log_likelihood(const Graph &graph, const Assignment &partition, const std::string &model,
                            const ParameterMap &parameters) {
    std::unique_ptr<IQualityModel> quality_model = model::make(model::parse(model));
    double parameter = resolve_parameter(*quality_model, parameters);
    return likelihood::log_likelihood(graph, partition, *quality_model, statistics::model_context(graph), parameter);
}

Parameter estimate_parameter(const Graph &graph, const Assignment &partition, const std::string &model) {
    std::unique_ptr<IQualityModel> quality_model = model::make(model::parse(model));
    Assignment compact = likelihood::validated(graph, partition);
    BrentMinimizer minimizer;
    Parameter result;
    result.name = quality_model->parameter_name();
    result.value = estimation::estimate(graph, compact, *quality_model, statistics::model_context(graph), minimizer,
                                        quality_model->default_parameter()).value;
    return result;
}

}  // namespace mll
