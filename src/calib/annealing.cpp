#include "libpheno/calib/annealing.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace pheno::calib {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double TAIL_LIMIT = 1e8;
constexpr double MIN_VISIT_BOUND = 1e-10;

// Visiting distribution of generalized simulated annealing, sampled as a
// ratio of scaled normals.
class VisitingDistribution {
public:
    VisitingDistribution(const std::vector<double>& lb,
                         const std::vector<double>& ub,
                         double qv,
                         std::mt19937_64& rng)
        : lb_(lb), ub_(ub), qv_(qv), rng_(rng) {
        range_.resize(lb.size());
        for (std::size_t i = 0; i < lb.size(); ++i) {
            range_[i] = ub[i] - lb[i];
        }
        const double factor2 = std::exp((4.0 - qv_) * std::log(qv_ - 1.0));
        const double factor3 = std::exp((2.0 - qv_) * std::log(2.0) / (qv_ - 1.0));
        factor4_p_ = std::sqrt(PI) * factor2 / (factor3 * (3.0 - qv_));
        const double factor5 = 1.0 / (qv_ - 1.0) - 0.5;
        const double d1 = 2.0 - factor5;
        factor6_ = PI * (1.0 - factor5) / std::sin(PI * (1.0 - factor5)) / std::exp(std::lgamma(d1));
    }

    // Full move for step < dim, single-coordinate move afterwards.
    std::vector<double> visit(const std::vector<double>& x, std::size_t step, double temperature) {
        const std::size_t dim = x.size();
        std::vector<double> out = x;
        if (step < dim) {
            for (std::size_t i = 0; i < dim; ++i) {
                out[i] = wrap(i, x[i] + clip_tail(draw(temperature)));
            }
        } else {
            const std::size_t i = step - dim;
            out[i] = wrap(i, x[i] + clip_tail(draw(temperature)));
        }
        return out;
    }

private:
    double draw(double temperature) {
        double x = normal_(rng_);
        const double y = normal_(rng_);
        const double factor1 = std::exp(std::log(temperature) / (qv_ - 1.0));
        const double factor4 = factor4_p_ * factor1;
        x *= std::exp(-(qv_ - 1.0) * std::log(factor6_ / factor4) / (3.0 - qv_));
        const double den = std::exp((qv_ - 1.0) * std::log(std::abs(y)) / (3.0 - qv_));
        return x / den;
    }

    double clip_tail(double v) {
        if (std::isnan(v)) return 0.0;
        if (v > TAIL_LIMIT) return TAIL_LIMIT * uniform_(rng_);
        if (v < -TAIL_LIMIT) return -TAIL_LIMIT * uniform_(rng_);
        return v;
    }

    // Periodic wrap into [lb, ub].
    double wrap(std::size_t i, double v) const {
        if (range_[i] <= 0.0) {
            return lb_[i];
        }
        const double a = v - lb_[i];
        const double b = std::fmod(a, range_[i]) + range_[i];
        double out = std::fmod(b, range_[i]) + lb_[i];
        if (std::abs(out - lb_[i]) < MIN_VISIT_BOUND) {
            out += MIN_VISIT_BOUND;
        }
        return std::clamp(out, lb_[i], ub_[i]);
    }

    const std::vector<double>& lb_;
    const std::vector<double>& ub_;
    std::vector<double> range_;
    double qv_;
    double factor4_p_ = 0.0;
    double factor6_ = 0.0;
    std::mt19937_64& rng_;
    std::normal_distribution<double> normal_{0.0, 1.0};
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

void check_config(const AnnealingConfig& cfg) {
    if (!(cfg.visiting_param > 1.0 && cfg.visiting_param < 3.0)) {
        throw ConfigurationError("simulated annealing: visiting_param must lie in (1, 3)");
    }
    if (!(cfg.acceptance_param < 1.0)) {
        throw ConfigurationError("simulated annealing: acceptance_param must be < 1");
    }
    if (!(cfg.initial_temperature > 0.0)) {
        throw ConfigurationError("simulated annealing: initial_temperature must be positive");
    }
}

} // namespace

AnnealingResult simulated_annealing(const Objective& f,
                                    const std::vector<double>& lb,
                                    const std::vector<double>& ub,
                                    const AnnealingConfig& cfg,
                                    const LocalSearchConfig& local,
                                    std::size_t max_calls,
                                    std::uint64_t seed) {
    check_config(cfg);
    if (max_calls == 0) {
        throw ConfigurationError("simulated annealing: max_calls must be positive");
    }
    const std::size_t dim = lb.size();
    const std::size_t budget = max_calls;
    const std::size_t search_budget = cfg.local_refinement ? budget - budget / 4 : budget;

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    VisitingDistribution visiting(lb, ub, cfg.visiting_param, rng);

    AnnealingResult res;
    auto evaluate = [&](const std::vector<double>& x) {
        ++res.evaluations;
        return f(x);
    };
    auto random_point = [&]() {
        std::vector<double> x(dim);
        for (std::size_t i = 0; i < dim; ++i) {
            x[i] = std::clamp(lb[i] + (ub[i] - lb[i]) * uni(rng), lb[i], ub[i]);
        }
        return x;
    };

    std::vector<double> current = random_point();
    double current_f = evaluate(current);
    res.x = current;
    res.value = current_f;

    const double qv = cfg.visiting_param;
    const double qa = cfg.acceptance_param;
    const double t1 = std::exp((qv - 1.0) * std::log(2.0)) - 1.0;
    const double restart_temperature = cfg.initial_temperature * cfg.restart_temp_ratio;

    int step = 0;
    bool done = res.evaluations >= search_budget;
    while (!done && res.iterations < cfg.max_iters) {
        const double s = static_cast<double>(step) + 2.0;
        const double t2 = std::exp((qv - 1.0) * std::log(s)) - 1.0;
        const double temperature = cfg.initial_temperature * t1 / t2;

        if (temperature < restart_temperature) {
            // reanneal from a fresh random state
            current = random_point();
            current_f = evaluate(current);
            if (current_f < res.value) {
                res.x = current;
                res.value = current_f;
            }
            ++res.restarts;
            step = 0;
            done = res.evaluations >= search_budget;
            continue;
        }

        const double temperature_step = temperature / static_cast<double>(step + 1);
        for (std::size_t j = 0; j < 2 * dim && !done; ++j) {
            const auto candidate = visiting.visit(current, j, temperature);
            const double cand_f = evaluate(candidate);
            bool accept = cand_f < current_f;
            if (!accept) {
                const double pqv_temp = 1.0 - (1.0 - qa) * (cand_f - current_f) / temperature_step;
                const double pqv = (pqv_temp <= 0.0) ? 0.0 : std::exp(std::log(pqv_temp) / (1.0 - qa));
                accept = uni(rng) <= pqv;
            }
            if (accept) {
                current = candidate;
                current_f = cand_f;
                if (current_f < res.value) {
                    res.x = current;
                    res.value = current_f;
                }
            }
            done = res.evaluations >= search_budget;
        }

        ++step;
        ++res.iterations;
    }

    if (cfg.local_refinement && res.evaluations < budget) {
        std::size_t used = 0;
        const auto polished = refine(f, res.x, lb, ub, local, budget - res.evaluations, used);
        res.evaluations += used;
        if (polished.obj < res.value) {
            res.x = polished.x;
            res.value = polished.obj;
        }
    }

    log::logger()->debug("simulated annealing: best={} after {} evaluations, {} iterations, {} restarts",
                         res.value, res.evaluations, res.iterations, res.restarts);
    return res;
}

} // namespace pheno::calib
