#include "libpheno/calib/optimizer.hpp"

#include "libpheno/calib/objective.hpp"
#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"
#include "libpheno/data/dataset.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace pheno::calib {

namespace {

std::string lower_case(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void check_problem(const CalibrationProblem& problem, Method method) {
    if (problem.parameters.empty()) {
        throw ConfigurationError("optimizer: no parameters to optimize");
    }
    for (const auto& p : problem.parameters) {
        if (!std::isfinite(p.lower) || !std::isfinite(p.upper)) {
            throw ConfigurationError("optimizer: non-finite bound for parameter " + p.name);
        }
        if (p.lower > p.upper) {
            throw ConfigurationError("optimizer: lower > upper for parameter " + p.name);
        }
    }
    if (method == Method::Bayesian) {
        if (!problem.log_likelihood) {
            throw ConfigurationError("optimizer: Bayesian sampling needs a log-likelihood");
        }
    } else if (!problem.objective) {
        throw ConfigurationError("optimizer: missing objective function");
    }
}

} // namespace

void check_bounds(const std::vector<ParameterSpec>& parameters,
                  const std::vector<double>& x,
                  Method method) {
    if (x.size() != parameters.size()) {
        std::ostringstream oss;
        oss << to_string(method) << " returned " << x.size() << " parameters, expected "
            << parameters.size();
        throw ConstraintViolationError(oss.str());
    }
    for (std::size_t i = 0; i < x.size(); ++i) {
        const auto& p = parameters[i];
        if (!(x[i] >= p.lower && x[i] <= p.upper)) {
            std::ostringstream oss;
            oss << to_string(method) << " returned " << p.name << "=" << x[i]
                << " outside [" << p.lower << ", " << p.upper << "]";
            throw ConstraintViolationError(oss.str());
        }
    }
}

Method parse_method(const std::string& name) {
    const auto key = lower_case(name);
    if (key == "gensa" || key == "sa") return Method::SimulatedAnnealing;
    if (key == "genoud" || key == "ga") return Method::Genetic;
    if (key == "bayesiantools" || key == "bayes") return Method::Bayesian;
    throw ConfigurationError("Unknown optimizer method: " + name);
}

std::string to_string(Method method) {
    switch (method) {
    case Method::SimulatedAnnealing: return "GenSA";
    case Method::Genetic: return "genoud";
    case Method::Bayesian: return "BayesianTools";
    }
    throw ConfigurationError("Unknown optimizer method");
}

const std::vector<double>& OptimizationResult::params() const {
    return std::visit([](const auto& e) -> const std::vector<double>& { return e.params; }, estimate);
}

std::size_t OptimizationResult::evaluations() const {
    return std::visit([](const auto& e) { return e.evaluations; }, estimate);
}

OptimizationResult minimize(const CalibrationProblem& problem,
                            Method method,
                            const OptimizerControl& control) {
    check_problem(problem, method);

    const std::size_t n = problem.parameters.size();
    std::vector<double> lb(n), ub(n);
    for (std::size_t i = 0; i < n; ++i) {
        lb[i] = problem.parameters[i].lower;
        ub[i] = problem.parameters[i].upper;
    }

    OptimizationResult res;
    res.method = method;
    switch (method) {
    case Method::SimulatedAnnealing: {
        auto sa = simulated_annealing(problem.objective, lb, ub, control.annealing, control.local,
                                      control.max_calls, control.seed);
        res.estimate = PointEstimate{std::move(sa.x), sa.value, sa.evaluations};
        break;
    }
    case Method::Genetic: {
        auto ga = genetic_search(problem.objective, lb, ub, control.genetic, control.local,
                                 control.max_calls, control.seed);
        res.estimate = PointEstimate{std::move(ga.x), ga.value, ga.evaluations};
        break;
    }
    case Method::Bayesian: {
        auto mc = sample_posterior(problem.log_likelihood, lb, ub, control.sampler, control.seed);
        PosteriorEstimate post;
        post.params = std::move(mc.map);
        post.log_posterior = mc.map_log_posterior;
        post.samples = std::move(mc.samples);
        post.sample_log_posterior = std::move(mc.log_posterior);
        post.acceptance_rate = mc.acceptance_rate;
        post.evaluations = mc.evaluations;
        res.estimate = std::move(post);
        break;
    }
    default:
        throw ConfigurationError("Unknown optimizer method: " +
                                 std::to_string(static_cast<int>(method)));
    }

    check_bounds(problem.parameters, res.params(), res.method);
    return res;
}

OptimizationResult optimize(const models::ModelSpec& model,
                            const FlatData& data,
                            const std::vector<double>& lower_bounds,
                            const std::vector<double>& upper_bounds,
                            Method method,
                            const OptimizerControl& control) {
    if (lower_bounds.size() != upper_bounds.size()) {
        throw ConfigurationError("Bounds mismatch: " + std::to_string(lower_bounds.size()) +
                                 " lower vs " + std::to_string(upper_bounds.size()) + " upper bounds");
    }

    const RmseObjective objective(model, data);

    CalibrationProblem problem;
    problem.parameters.reserve(lower_bounds.size());
    const bool named = model.parameters.size() == lower_bounds.size();
    for (std::size_t i = 0; i < lower_bounds.size(); ++i) {
        problem.parameters.push_back({named ? model.parameters[i] : "p" + std::to_string(i + 1),
                                      lower_bounds[i], upper_bounds[i]});
    }
    problem.objective = [&objective](const std::vector<double>& x) { return objective(x); };
    problem.log_likelihood = [&objective](const std::vector<double>& x) { return objective.log_likelihood(x); };

    log::logger()->debug("optimize: {} with {} over {} records", model.name, to_string(method),
                         objective.n_measured());
    return minimize(problem, method, control);
}

OptimizationResult optimize(const std::string& model,
                            const Dataset& data,
                            const std::vector<double>& lower_bounds,
                            const std::vector<double>& upper_bounds,
                            Method method,
                            const OptimizerControl& control,
                            const models::ModelRegistry& registry) {
    const auto& spec = registry.find(model);
    const auto flat = data::flatten(data);
    return optimize(spec, flat, lower_bounds, upper_bounds, method, control);
}

} // namespace pheno::calib
