#pragma once

#include "libpheno/calib/local_search.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pheno::calib {

struct SamplerConfig {
    std::size_t iterations = 10000;  // total log-likelihood evaluations
    std::size_t burn_in = 2000;      // evaluations discarded from the returned sample
    int chains = 3;
    int archive_update = 10;         // generations between archive appends
    double jump_scale = 2.38;        // gamma = jump_scale / sqrt(2 d)
    double mode_jump_prob = 0.1;     // probability of gamma = 1
    double noise_scale = 1e-4;       // relative to the bound width
};

struct SamplerResult {
    std::vector<std::vector<double>> samples;  // post burn-in chain states
    std::vector<double> log_posterior;         // one per sample
    std::vector<double> map;                   // highest posterior point evaluated
    double map_log_posterior = 0.0;
    double acceptance_rate = 0.0;
    std::size_t evaluations = 0;
};

// Differential-evolution MCMC with an archive of past states (DEzs) under
// a uniform prior on [lb, ub]. `log_likelihood` is never called outside
// the bounds.
SamplerResult sample_posterior(const Objective& log_likelihood,
                               const std::vector<double>& lb,
                               const std::vector<double>& ub,
                               const SamplerConfig& cfg,
                               std::uint64_t seed);

} // namespace pheno::calib
