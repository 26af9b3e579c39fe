#include "libpheno/calib/objective.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/data/dataset.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace pheno::calib {

namespace {

constexpr double TWO_PI = 6.28318530717958647692;
constexpr double MIN_MSE = 1e-12;

} // namespace

RmseObjective::RmseObjective(const models::ModelSpec& model, const FlatData& data)
    : model_(model), data_(data), n_(data::count_measured(data.transition_dates)) {
    if (n_ == 0) {
        throw InsufficientDataError("objective: dataset has no measured transition dates");
    }
}

std::vector<double> RmseObjective::predict(const std::vector<double>& par) const {
    return models::predict(model_, par, data_);
}

double RmseObjective::mean_squared_error(const std::vector<double>& par) const {
    const auto pred = predict(par);
    double sse = 0.0;
    for (std::size_t i = 0; i < pred.size(); ++i) {
        const double obs = data_.transition_dates[i];
        if (!std::isfinite(obs)) {
            continue;
        }
        if (!std::isfinite(pred[i])) {
            throw EvaluationError(model_.name + ": non-finite prediction for record " + std::to_string(i));
        }
        const double e = pred[i] - obs;
        sse += e * e;
    }
    return sse / static_cast<double>(n_);
}

double RmseObjective::operator()(const std::vector<double>& par) const {
    return std::sqrt(mean_squared_error(par));
}

double RmseObjective::log_likelihood(const std::vector<double>& par) const {
    const double mse = std::max(MIN_MSE, mean_squared_error(par));
    return -0.5 * static_cast<double>(n_) * (std::log(TWO_PI * mse) + 1.0);
}

} // namespace pheno::calib
