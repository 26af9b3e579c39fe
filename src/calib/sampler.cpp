#include "libpheno/calib/sampler.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace pheno::calib {

namespace {

constexpr std::size_t ARCHIVE_PER_DIM = 10;

void check_config(const SamplerConfig& cfg) {
    if (cfg.chains < 1) {
        throw ConfigurationError("sampler: chains must be positive");
    }
    if (cfg.iterations < 2 * static_cast<std::size_t>(cfg.chains)) {
        throw ConfigurationError("sampler: iterations must cover at least two steps per chain");
    }
    if (cfg.burn_in >= cfg.iterations) {
        throw ConfigurationError("sampler: burn_in must be smaller than iterations");
    }
    // chain steps run in whole generations of `chains`
    const std::size_t n_chains = static_cast<std::size_t>(cfg.chains);
    if (n_chains * (cfg.iterations / n_chains) <= cfg.burn_in) {
        throw ConfigurationError("sampler: burn_in leaves no post burn-in sample");
    }
    if (cfg.archive_update < 1) {
        throw ConfigurationError("sampler: archive_update must be positive");
    }
}

} // namespace

SamplerResult sample_posterior(const Objective& log_likelihood,
                               const std::vector<double>& lb,
                               const std::vector<double>& ub,
                               const SamplerConfig& cfg,
                               std::uint64_t seed) {
    check_config(cfg);
    const std::size_t dim = lb.size();
    const std::size_t n_chains = static_cast<std::size_t>(cfg.chains);

    std::vector<double> range(dim);
    double log_prior = 0.0;
    std::size_t free_dims = 0;
    for (std::size_t i = 0; i < dim; ++i) {
        range[i] = ub[i] - lb[i];
        if (range[i] > 0.0) {
            log_prior -= std::log(range[i]);
            ++free_dims;
        }
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    std::normal_distribution<double> normal(0.0, 1.0);

    auto prior_draw = [&]() {
        std::vector<double> x(dim);
        for (std::size_t i = 0; i < dim; ++i) {
            x[i] = std::clamp(lb[i] + range[i] * uni(rng), lb[i], ub[i]);
        }
        return x;
    };
    auto inside = [&](const std::vector<double>& x) {
        for (std::size_t i = 0; i < dim; ++i) {
            if (!(x[i] >= lb[i] && x[i] <= ub[i])) {
                return false;
            }
        }
        return true;
    };

    SamplerResult res;
    res.map_log_posterior = -std::numeric_limits<double>::infinity();
    auto log_posterior = [&](const std::vector<double>& x) {
        ++res.evaluations;
        const double lp = log_likelihood(x) + log_prior;
        if (lp > res.map_log_posterior || res.map.empty()) {
            res.map = x;
            res.map_log_posterior = lp;
        }
        return lp;
    };

    std::vector<std::vector<double>> archive;
    const std::size_t archive_size = std::max(ARCHIVE_PER_DIM * std::max<std::size_t>(1, dim), 3 * n_chains);
    archive.reserve(archive_size + cfg.iterations / (n_chains * cfg.archive_update) * n_chains + n_chains);
    for (std::size_t i = 0; i < archive_size; ++i) {
        archive.push_back(prior_draw());
    }

    std::vector<std::vector<double>> state(n_chains);
    std::vector<double> state_lp(n_chains);
    std::size_t steps = 0;
    for (std::size_t c = 0; c < n_chains; ++c) {
        state[c] = prior_draw();
        state_lp[c] = log_posterior(state[c]);
        ++steps;
    }

    const double gamma_default = cfg.jump_scale / std::sqrt(2.0 * static_cast<double>(std::max<std::size_t>(1, free_dims)));
    std::uniform_int_distribution<std::size_t> pick(0, archive.size() - 1);
    std::size_t proposals = 0;
    std::size_t accepted = 0;
    int generation = 0;

    while (steps + n_chains <= cfg.iterations) {
        for (std::size_t c = 0; c < n_chains; ++c) {
            const std::size_t r1 = pick(rng);
            std::size_t r2 = pick(rng);
            while (r2 == r1) {
                r2 = pick(rng);
            }
            const double gamma = (uni(rng) < cfg.mode_jump_prob) ? 1.0 : gamma_default;

            std::vector<double> prop(dim);
            for (std::size_t i = 0; i < dim; ++i) {
                prop[i] = state[c][i] + gamma * (archive[r1][i] - archive[r2][i]) +
                          cfg.noise_scale * range[i] * normal(rng);
            }

            ++proposals;
            ++steps;
            if (inside(prop)) {
                const double lp = log_posterior(prop);
                if (std::log(uni(rng)) < lp - state_lp[c]) {
                    state[c] = std::move(prop);
                    state_lp[c] = lp;
                    ++accepted;
                }
            }

            if (steps > cfg.burn_in) {
                res.samples.push_back(state[c]);
                res.log_posterior.push_back(state_lp[c]);
            }
        }

        if (++generation % cfg.archive_update == 0) {
            archive.insert(archive.end(), state.begin(), state.end());
            pick = std::uniform_int_distribution<std::size_t>(0, archive.size() - 1);
        }
    }

    res.acceptance_rate = (proposals > 0) ? static_cast<double>(accepted) / static_cast<double>(proposals) : 0.0;
    log::logger()->debug("sampler: {} samples, acceptance {:.3f}, MAP log posterior {}",
                         res.samples.size(), res.acceptance_rate, res.map_log_posterior);
    return res;
}

} // namespace pheno::calib
