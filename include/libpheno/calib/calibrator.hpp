#pragma once

#include "libpheno/calib/optimizer.hpp"
#include "libpheno/core/types.hpp"
#include "libpheno/data/parameter_ranges.hpp"
#include "libpheno/models/registry.hpp"
#include "libpheno/stats/metrics.hpp"

#include <string>
#include <vector>

namespace pheno::calib {

struct CalibrationResult {
    std::string model;
    Method method = Method::SimulatedAnnealing;
    std::vector<ParameterSpec> bounds;
    std::vector<double> params;
    std::vector<double> measured;
    std::vector<double> predicted;
    double rmse = 0.0;
    double rmse_null = 0.0;
    stats::AicRecord aic;
    stats::LinearFit fit;           // measured ~ predicted
    OptimizationResult optimizer;   // raw backend payload
};

// Fits `model` to `data` within the bounds listed for it in `ranges`.
// Throws ConfigurationError when the model is unknown to `registry`, has no
// row in `ranges` or its row has the wrong arity (before any evaluation),
// InsufficientDataError when no measured date is present. Optimizer and
// evaluator failures propagate.
CalibrationResult calibrate(const std::string& model,
                            const Dataset& data,
                            Method method,
                            const OptimizerControl& control,
                            const data::ParameterRangeTable& ranges,
                            const models::ModelRegistry& registry = models::ModelRegistry::builtin());

} // namespace pheno::calib
