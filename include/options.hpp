/***
 * Configuration of a single optimization run.
 */
#ifndef MLL_OPTIONS_HPP
#define MLL_OPTIONS_HPP

typedef struct options_t {
    /// Maximum number of sweeps over the vertices of a level. -1 means no limit.
    long max_passes = -1;
    /// Maximum number of partition / parameter alternations.
    long max_outer_iterations = 100;
    /// The run has converged once the parameter changes by at most this much between two iterations.
    double tolerance = 1e-5;
    /// Seeds the vertex order of the local search.
    unsigned long seed = 0;
    /// If true, prints progress to stdout.
    bool verbose = false;
} Options;

#endif // MLL_OPTIONS_HPP
