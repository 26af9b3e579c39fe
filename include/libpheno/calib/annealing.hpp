#pragma once

#include "libpheno/calib/local_search.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pheno::calib {

struct AnnealingConfig {
    double initial_temperature = 5230.0;
    double visiting_param = 2.62;      // qv, in (1, 3)
    double acceptance_param = -5.0;    // qa, < 1
    double restart_temp_ratio = 2e-5;  // reanneal below T0 * ratio
    int max_iters = 1000;
    bool local_refinement = true;
};

struct AnnealingResult {
    std::vector<double> x;
    double value = 0.0;
    std::size_t evaluations = 0;
    int iterations = 0;
    int restarts = 0;
};

// Generalized simulated annealing (Tsallis & Stariolo visiting
// distribution, generalized Metropolis acceptance) inside [lb, ub]. Stops
// after `max_calls` objective evaluations or cfg.max_iters temperature
// steps; with local_refinement the best point is polished by projected
// gradient descent using whatever budget remains (at most a quarter of it).
AnnealingResult simulated_annealing(const Objective& f,
                                    const std::vector<double>& lb,
                                    const std::vector<double>& ub,
                                    const AnnealingConfig& cfg,
                                    const LocalSearchConfig& local,
                                    std::size_t max_calls,
                                    std::uint64_t seed);

} // namespace pheno::calib
