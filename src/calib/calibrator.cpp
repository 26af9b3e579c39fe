#include "libpheno/calib/calibrator.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/core/logging.hpp"
#include "libpheno/data/dataset.hpp"

#include <cmath>
#include <sstream>

namespace pheno::calib {

CalibrationResult calibrate(const std::string& model,
                            const Dataset& data,
                            Method method,
                            const OptimizerControl& control,
                            const data::ParameterRangeTable& ranges,
                            const models::ModelRegistry& registry) {
    const auto& spec = registry.find(model);
    const auto& bounds = ranges.at(model);
    if (bounds.size() != spec.parameters.size()) {
        std::ostringstream oss;
        oss << "parameter ranges for " << model << " declare " << bounds.size()
            << " parameters, model expects " << spec.parameters.size();
        throw ConfigurationError(oss.str());
    }

    const auto flat = data::flatten(data);
    if (data::count_measured(flat.transition_dates) == 0) {
        throw InsufficientDataError("calibrate: no measured transition dates for " + model);
    }

    log::logger()->info("calibrating {} with {} on {} records", model, to_string(method), flat.n_records);

    std::vector<double> lower, upper;
    lower.reserve(bounds.size());
    upper.reserve(bounds.size());
    for (const auto& p : bounds) {
        lower.push_back(p.lower);
        upper.push_back(p.upper);
    }

    CalibrationResult res;
    res.model = model;
    res.method = method;
    res.bounds = bounds;
    res.optimizer = optimize(spec, flat, lower, upper, method, control);
    res.params = res.optimizer.params();

    res.measured = flat.transition_dates;
    res.predicted = models::predict(spec, res.params, flat);
    res.rmse = stats::rmse(res.measured, res.predicted);
    res.rmse_null = stats::null_rmse(res.measured);
    res.aic = stats::aicc(res.measured, res.predicted, res.params.size());
    res.fit = stats::linear_fit(res.predicted, res.measured);

    if (res.aic.rss == 0.0) {
        log::logger()->warn("{}: perfect fit, AIC and AICc are -inf", model);
    }
    if (!std::isfinite(res.aic.correction)) {
        log::logger()->warn("{}: {} records are too few for the AICc correction with k={}",
                            model, res.aic.n, res.aic.k);
    }
    log::logger()->info("{}: RMSE={:.3f} RMSE(null)={:.3f} AICc={:.3f} after {} evaluations",
                        model, res.rmse, res.rmse_null, res.aic.aicc, res.optimizer.evaluations());
    log::logger()->info("{}: measured = {:.3f} + {:.3f} * predicted, R2={:.3f}",
                        model, res.fit.intercept, res.fit.slope, res.fit.r_squared);
    return res;
}

} // namespace pheno::calib
