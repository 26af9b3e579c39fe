#include "libpheno/calib/genetic.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>

namespace pheno::calib {

namespace {

constexpr double NON_UNIFORM_SHAPE = 6.0;

enum class Operator {
    Clone,
    UniformMutation,
    BoundaryMutation,
    NonUniformMutation,
    WholeArithmeticCrossover,
    SimpleCrossover,
    HeuristicCrossover
};

struct Member {
    std::vector<double> x;
    double f;
};

class Breeder {
public:
    Breeder(const std::vector<double>& lb,
            const std::vector<double>& ub,
            const GeneticConfig& cfg,
            std::mt19937_64& rng)
        : lb_(lb), ub_(ub), cfg_(cfg), rng_(rng),
          ops_({1.0, 2.0, 2.0, 2.0, 2.0, 2.0, 2.0}) {}

    std::vector<double> random_point() {
        std::vector<double> x(lb_.size());
        for (std::size_t i = 0; i < x.size(); ++i) {
            x[i] = std::clamp(lb_[i] + (ub_[i] - lb_[i]) * uni_(rng_), lb_[i], ub_[i]);
        }
        return x;
    }

    std::vector<double> child(const std::vector<Member>& pop, int generation) {
        const Member& p1 = tournament(pop);
        const Member& p2 = tournament(pop);
        const std::size_t dim = p1.x.size();
        std::vector<double> c = p1.x;
        std::uniform_int_distribution<std::size_t> pick(0, dim - 1);

        switch (static_cast<Operator>(ops_(rng_))) {
        case Operator::Clone:
            break;
        case Operator::UniformMutation: {
            const std::size_t i = pick(rng_);
            c[i] = lb_[i] + (ub_[i] - lb_[i]) * uni_(rng_);
            break;
        }
        case Operator::BoundaryMutation: {
            const std::size_t i = pick(rng_);
            c[i] = (uni_(rng_) < 0.5) ? lb_[i] : ub_[i];
            break;
        }
        case Operator::NonUniformMutation: {
            const std::size_t i = pick(rng_);
            const double progress = std::min(1.0, static_cast<double>(generation) /
                                                  std::max(1, cfg_.max_generations));
            const double shrink = 1.0 - std::pow(uni_(rng_), std::pow(1.0 - progress, NON_UNIFORM_SHAPE));
            if (uni_(rng_) < 0.5) {
                c[i] += (ub_[i] - c[i]) * shrink;
            } else {
                c[i] -= (c[i] - lb_[i]) * shrink;
            }
            break;
        }
        case Operator::WholeArithmeticCrossover: {
            const double a = uni_(rng_);
            for (std::size_t i = 0; i < dim; ++i) {
                c[i] = a * p1.x[i] + (1.0 - a) * p2.x[i];
            }
            break;
        }
        case Operator::SimpleCrossover: {
            if (dim > 1) {
                std::uniform_int_distribution<std::size_t> cut(1, dim - 1);
                const std::size_t at = cut(rng_);
                std::copy(p2.x.begin() + static_cast<std::ptrdiff_t>(at), p2.x.end(),
                          c.begin() + static_cast<std::ptrdiff_t>(at));
            }
            break;
        }
        case Operator::HeuristicCrossover: {
            const Member& better = (p1.f <= p2.f) ? p1 : p2;
            const Member& worse = (p1.f <= p2.f) ? p2 : p1;
            const double r = uni_(rng_);
            for (std::size_t i = 0; i < dim; ++i) {
                c[i] = better.x[i] + r * (better.x[i] - worse.x[i]);
            }
            break;
        }
        }

        for (std::size_t i = 0; i < dim; ++i) {
            c[i] = std::clamp(c[i], lb_[i], ub_[i]);
        }
        return c;
    }

private:
    const Member& tournament(const std::vector<Member>& pop) {
        std::uniform_int_distribution<std::size_t> pick(0, pop.size() - 1);
        const Member* best = &pop[pick(rng_)];
        for (int k = 1; k < cfg_.tournament_size; ++k) {
            const Member* m = &pop[pick(rng_)];
            if (m->f < best->f) {
                best = m;
            }
        }
        return *best;
    }

    const std::vector<double>& lb_;
    const std::vector<double>& ub_;
    const GeneticConfig& cfg_;
    std::mt19937_64& rng_;
    std::discrete_distribution<int> ops_;
    std::uniform_real_distribution<double> uni_{0.0, 1.0};
};

void check_config(const GeneticConfig& cfg) {
    if (cfg.pop_size < 2) {
        throw ConfigurationError("genetic search: pop_size must be at least 2");
    }
    if (cfg.max_generations < 1 || cfg.wait_generations < 1 || cfg.tournament_size < 1) {
        throw ConfigurationError("genetic search: generation limits and tournament size must be positive");
    }
}

} // namespace

GeneticResult genetic_search(const Objective& f,
                             const std::vector<double>& lb,
                             const std::vector<double>& ub,
                             const GeneticConfig& cfg,
                             const LocalSearchConfig& local,
                             std::size_t max_calls,
                             std::uint64_t seed) {
    check_config(cfg);
    if (max_calls == 0) {
        throw ConfigurationError("genetic search: max_calls must be positive");
    }
    const std::size_t budget = max_calls;
    const std::size_t pop_size = std::min<std::size_t>(static_cast<std::size_t>(cfg.pop_size), budget);

    std::mt19937_64 rng(seed);
    Breeder breeder(lb, ub, cfg, rng);

    GeneticResult res;
    auto evaluate = [&](const std::vector<double>& x) {
        ++res.evaluations;
        return f(x);
    };
    auto by_fitness = [](const Member& a, const Member& b) { return a.f < b.f; };

    std::vector<Member> pop;
    pop.reserve(pop_size);
    for (std::size_t i = 0; i < pop_size; ++i) {
        auto x = breeder.random_point();
        const double fx = evaluate(x);
        pop.push_back({std::move(x), fx});
    }
    std::sort(pop.begin(), pop.end(), by_fitness);

    double best_f = pop.front().f;
    int stalled = 0;
    for (int gen = 1; gen <= cfg.max_generations && res.evaluations < budget; ++gen) {
        std::vector<Member> next;
        next.reserve(pop_size);
        next.push_back(pop.front());
        while (next.size() < pop_size && res.evaluations < budget) {
            auto c = breeder.child(pop, gen);
            const double fc = evaluate(c);
            next.push_back({std::move(c), fc});
        }
        // out of budget: carry over the best of the previous generation
        for (std::size_t i = 1; next.size() < pop_size; ++i) {
            next.push_back(pop[i]);
        }
        pop = std::move(next);
        std::sort(pop.begin(), pop.end(), by_fitness);
        res.generations = gen;

        if (pop.front().f < best_f - cfg.improvement_tol) {
            stalled = 0;
        } else if (++stalled >= cfg.wait_generations) {
            break;
        }
        best_f = std::min(best_f, pop.front().f);
    }

    res.x = pop.front().x;
    res.value = pop.front().f;

    if (cfg.local_refinement && res.evaluations < budget) {
        std::size_t used = 0;
        const auto polished = refine(f, res.x, lb, ub, local, budget - res.evaluations, used);
        res.evaluations += used;
        if (polished.obj < res.value) {
            res.x = polished.x;
            res.value = polished.obj;
        }
    }

    log::logger()->debug("genetic search: best={} after {} evaluations, {} generations",
                         res.value, res.evaluations, res.generations);
    return res;
}

} // namespace pheno::calib
