#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <omp.h>

#include "args.hpp"
#include "evaluate.hpp"
#include "graph.hpp"
#include "likelihood.hpp"
#include "mll.hpp"
#include "model/quality_model.hpp"
#include "utils.hpp"

Args args;

namespace {

/// Runs `num_runs` independently seeded optimizations in parallel. Rethrows the first error once all runs are done.
std::vector<Result> run_all(const Graph &graph, const std::string &model, const mll::ParameterMap &parameters,
                            const Options &options, long num_runs) {
    std::vector<Result> results(num_runs);
    std::vector<std::exception_ptr> errors(num_runs);
    #pragma omp parallel for schedule(dynamic) default(none) \
    shared(graph, model, parameters, options, num_runs, results, errors)
    for (long run = 0; run < num_runs; ++run) {
        try {
            Options run_options = options;
            run_options.seed = options.seed + (unsigned long) run;
            results[run] = mll::best_partition(graph, model, parameters, run_options);
        } catch (const std::exception &) {
            errors[run] = std::current_exception();
        }
    }
    for (const std::exception_ptr &error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return results;
}

}  // namespace

int main(int argc, char* argv[]) {
    args = Args(argc, argv);
    if (args.threads > 0) omp_set_num_threads(args.threads);
    try {
        ModelType type = model::parse(args.model);
        Graph graph = Graph::load(args.filepath);

        Options options;
        options.max_passes = args.maxpasses;
        options.max_outer_iterations = args.maxiterations;
        options.tolerance = args.tolerance;
        options.seed = args.seed;
        options.verbose = args.verbose;
        mll::ParameterMap parameters { { "gamma", args.gamma }, { "mu", args.mu } };
        long num_runs = std::max(1L, args.runs);

        double start_t = omp_get_wtime();
        std::vector<Result> results = run_all(graph, args.model, parameters, options, num_runs);
        double runtime = omp_get_wtime() - start_t;

        std::vector<double> log_likelihoods;
        for (long run = 0; run < num_runs; ++run) {
            const Result &result = results[run];
            log_likelihoods.push_back(result.log_likelihood);
            std::cout << "Run " << run << " (seed " << options.seed + run << "): " << result.num_communities
                      << " communities, " << result.parameter.name << " = " << result.parameter.value
                      << ", log-likelihood = " << result.log_likelihood << ", iterations = "
                      << result.outer_iterations << (result.converged ? "" : " (not converged)") << std::endl;
        }
        std::vector<long> ranking = likelihood::rank(log_likelihoods);
        const Result &best = results[ranking[0]];
        std::cout << "Best run: " << ranking[0] << " with " << best.num_communities << " communities and "
                  << "log-likelihood " << best.log_likelihood << std::endl;
        std::cout << "Community detection runtime = " << runtime << "s" << std::endl;

        nlohmann::json output;
        output["Runtime (s)"] = runtime;
        output["Filepath"] = args.filepath;
        output["Tag"] = args.tag;
        output["Model"] = model::name(type);
        output["Num. Runs"] = num_runs;
        output["Seed"] = args.seed;
        output["Num. Threads"] = omp_get_max_threads();
        output["Tolerance"] = args.tolerance;
        output["Max. Iterations"] = args.maxiterations;
        output["Max. Passes"] = args.maxpasses;
        output["Best Run"] = ranking[0];
        output["Parameter Name"] = best.parameter.name;
        output["Parameter"] = best.parameter.value;
        output["Log-Likelihood"] = best.log_likelihood;
        output["Run Log-Likelihoods"] = log_likelihoods;
        output["Converged"] = best.converged;
        output["Parameter Clamped"] = best.parameter_clamped;
        output["Num. Iterations"] = best.outer_iterations;
        output["Num. Communities"] = best.num_communities;
        output["Results"] = best.partition;
        if (graph.total_weight() > 0.0) {
            double modularity = graph.modularity(best.partition);
            std::cout << "Modularity = " << modularity << std::endl;
            output["Modularity"] = modularity;
        }
        if (!args.truth.empty()) {
            Assignment truth = evaluate::load_truth(args.truth, graph.num_vertices());
            evaluate::Comparison comparison = evaluate::compare_partitions(truth, best.partition);
            std::cout << "Rand index: " << comparison.rand << std::endl;
            std::cout << "Jaccard index: " << comparison.jaccard << std::endl;
            std::cout << "NMI: " << comparison.nmi << std::endl;
            output["Rand Index"] = comparison.rand;
            output["Jaccard Index"] = comparison.jaccard;
            output["NMI"] = comparison.nmi;
        }
        utils::write_json(output, fs::path(args.json), args.output_file);
    } catch (const std::exception &exception) {
        std::cerr << "ERROR " << exception.what() << std::endl;
        return -1;
    }
    return 0;
}
