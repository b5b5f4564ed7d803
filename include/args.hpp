/// A wrapper around tclap to make the use of command-line arguments bearable.
#ifndef MLL_ARGS_HPP
#define MLL_ARGS_HPP

#include <cstdlib>
#include <iostream>
#include <string>

#include "tclap/CmdLine.h"

class Args {
    public:  // Everything in here is public, because why not?
    /** Define all the arguments here for easy access */
    std::string filepath;
    double gamma;
    std::string json;
    long maxiterations;
    long maxpasses;
    std::string model;
    double mu;
    std::string output_file;
    long runs;
    unsigned long seed;
    std::string tag;
    int threads;
    double tolerance;
    std::string truth;
    bool verbose;

    /// Default Args constructor.
    Args() {}

    /// Parses the command-line options and stores the results in an easy-to-retrieve manner.
    Args(int argc, char** argv) {
        /** Use tclap to retrieve the arguments here */
        try {
            TCLAP::CmdLine parser("Community detection by likelihood maximization", ' ', "alpha.0.1");
            TCLAP::ValueArg<std::string> _filepath("f", "filepath", "The path to the graph: either a Matrix Market "
                                                   "file, or a text file with one \"from to [weight]\" edge per line. "
                                                   "Vertex ids start at 1.", true, "", "path", parser);
            TCLAP::ValueArg<double> _gamma("g", "gamma", "The initial resolution, for the ppm and dcppm models", false,
                                           1.0, "0 < x", parser);
            TCLAP::ValueArg<std::string> _json("j", "json", "The directory in which to store the json results.",
                                               false, "mll_results", "path", parser);
            TCLAP::ValueArg<long> _maxiterations("", "maxiterations", "The maximum number of alternations between "
                                                 "partition optimization and parameter estimation.", false, 100,
                                                 "int", parser);
            TCLAP::ValueArg<long> _maxpasses("", "maxpasses", "The maximum number of sweeps over the vertices of a "
                                             "level. -1 means no limit.", false, -1, "int", parser);
            TCLAP::ValueArg<std::string> _model("m", "model", "The generative model.", false, "dcppm",
                                                "ppm|dcppm|ilfr|ilfrs", parser);
            TCLAP::ValueArg<double> _mu("", "mu", "The initial mixing parameter, for the ilfr and ilfrs models",
                                        false, 0.5, "0 < x < 1", parser);
            TCLAP::ValueArg<std::string> _output_file("o", "output_file", "The filename of the json results. "
                                                      "Results are appended to it.", false, "output.json",
                                                      "filename", parser);
            TCLAP::ValueArg<long> _runs("r", "runs", "The number of independent runs. The most likely partition "
                                        "is kept.", false, 1, "int", parser);
            TCLAP::ValueArg<unsigned long> _seed("s", "seed", "The seed of the first run; run i uses seed + i.",
                                                 false, 0, "int", parser);
            TCLAP::ValueArg<std::string> _tag("", "tag", "The tag for this experiment, for differentiating results",
                                              false, "default_tag", "string", parser);
            TCLAP::ValueArg<int> _threads("", "threads", "The number of OpenMP threads used to run independent "
                                          "runs. If 0, the OpenMP default is used.", false, 0, "int", parser);
            TCLAP::ValueArg<double> _tolerance("", "tolerance", "Stop once the parameter changes by at most this "
                                               "much between iterations.", false, 1e-5, "0 <= x", parser);
            TCLAP::ValueArg<std::string> _truth("t", "truth", "The path to a ground-truth partition, with one "
                                                "\"vertex community\" pair per line. If set, the result is scored "
                                                "against it.", false, "", "path", parser);
            TCLAP::SwitchArg _verbose("v", "verbose", "If set, prints the progress of every run", parser, false);
            parser.parse(argc, argv);
            this->filepath = _filepath.getValue();
            this->gamma = _gamma.getValue();
            this->json = _json.getValue();
            this->maxiterations = _maxiterations.getValue();
            this->maxpasses = _maxpasses.getValue();
            this->model = _model.getValue();
            this->mu = _mu.getValue();
            this->output_file = _output_file.getValue();
            this->runs = _runs.getValue();
            this->seed = _seed.getValue();
            this->tag = _tag.getValue();
            this->threads = _threads.getValue();
            this->tolerance = _tolerance.getValue();
            this->truth = _truth.getValue();
            this->verbose = _verbose.getValue();
        } catch (TCLAP::ArgException &exception) {
            std::cerr << "ERROR: " << exception.error() << " for argument " << exception.argId() << std::endl;
            exit(-1);
        }
    }
};

extern Args args;

#endif // MLL_ARGS_HPP
