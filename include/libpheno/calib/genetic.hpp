#pragma once

#include "libpheno/calib/local_search.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pheno::calib {

struct GeneticConfig {
    int pop_size = 100;
    int max_generations = 100;
    int wait_generations = 10;      // stop after this many generations without improvement
    int tournament_size = 3;
    double improvement_tol = 1e-3;
    bool local_refinement = true;   // gradient polish of the final best member
};

struct GeneticResult {
    std::vector<double> x;
    double value = 0.0;
    std::size_t evaluations = 0;
    int generations = 0;
};

// Real-coded genetic search (genoud-style operator set) inside [lb, ub].
// Stops on max_generations, wait_generations or `max_calls` evaluations.
GeneticResult genetic_search(const Objective& f,
                             const std::vector<double>& lb,
                             const std::vector<double>& ub,
                             const GeneticConfig& cfg,
                             const LocalSearchConfig& local,
                             std::size_t max_calls,
                             std::uint64_t seed);

} // namespace pheno::calib
