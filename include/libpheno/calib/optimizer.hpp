#pragma once

#include "libpheno/calib/annealing.hpp"
#include "libpheno/calib/genetic.hpp"
#include "libpheno/calib/local_search.hpp"
#include "libpheno/calib/sampler.hpp"
#include "libpheno/core/types.hpp"
#include "libpheno/models/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pheno::calib {

enum class Method {
    SimulatedAnnealing,  // "GenSA"
    Genetic,             // "genoud"
    Bayesian             // "BayesianTools"
};

// Accepts GenSA / genoud / BayesianTools (and sa / ga / bayes), case
// insensitive. Throws ConfigurationError("Unknown optimizer method ...").
Method parse_method(const std::string& name);

std::string to_string(Method method);

struct OptimizerControl {
    std::size_t max_calls = 2000;   // evaluation budget of the point-estimate backends, > 0
    std::uint64_t seed = 42;
    AnnealingConfig annealing;
    GeneticConfig genetic;
    SamplerConfig sampler;          // carries its own, larger, budget
    LocalSearchConfig local;
};

struct PointEstimate {
    std::vector<double> params;
    double value = 0.0;             // objective (RMSE) at params
    std::size_t evaluations = 0;
};

struct PosteriorEstimate {
    std::vector<double> params;     // maximum a posteriori sample
    double log_posterior = 0.0;
    std::vector<std::vector<double>> samples;
    std::vector<double> sample_log_posterior;
    double acceptance_rate = 0.0;
    std::size_t evaluations = 0;
};

using Estimate = std::variant<PointEstimate, PosteriorEstimate>;

struct OptimizationResult {
    Method method = Method::SimulatedAnnealing;
    Estimate estimate;

    const std::vector<double>& params() const;
    std::size_t evaluations() const;
    // nullptr unless the backend produced a posterior sample
    const PosteriorEstimate* posterior() const { return std::get_if<PosteriorEstimate>(&estimate); }
};

struct CalibrationProblem {
    std::vector<ParameterSpec> parameters;
    Objective objective;            // minimized by the point-estimate backends
    Objective log_likelihood;       // required by Method::Bayesian
};

// Throws ConstraintViolationError unless `x` has one entry per parameter,
// each inside its [lower, upper].
void check_bounds(const std::vector<ParameterSpec>& parameters,
                  const std::vector<double>& x,
                  Method method);

// Dispatches to the selected backend. Throws ConfigurationError on a
// malformed problem and ConstraintViolationError if the backend returns a
// vector of the wrong arity or outside the bounds.
OptimizationResult minimize(const CalibrationProblem& problem,
                            Method method,
                            const OptimizerControl& control);

// Fits `model` to `data` by RMSE. Throws ConfigurationError("Bounds
// mismatch ...") when the bound vectors differ in length.
OptimizationResult optimize(const models::ModelSpec& model,
                            const FlatData& data,
                            const std::vector<double>& lower_bounds,
                            const std::vector<double>& upper_bounds,
                            Method method,
                            const OptimizerControl& control);

OptimizationResult optimize(const std::string& model,
                            const Dataset& data,
                            const std::vector<double>& lower_bounds,
                            const std::vector<double>& upper_bounds,
                            Method method,
                            const OptimizerControl& control,
                            const models::ModelRegistry& registry = models::ModelRegistry::builtin());

} // namespace pheno::calib
