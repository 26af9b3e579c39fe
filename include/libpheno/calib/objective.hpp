#pragma once

#include "libpheno/core/types.hpp"
#include "libpheno/models/registry.hpp"

#include <cstddef>
#include <vector>

namespace pheno::calib {

// RMSE between a model's predictions and the measured dates of `data`,
// skipping records whose measured date is missing. Holds references: the
// model and data must outlive the objective. Evaluator errors propagate.
class RmseObjective {
public:
    // Throws InsufficientDataError if no measured value is present.
    RmseObjective(const models::ModelSpec& model, const FlatData& data);

    double operator()(const std::vector<double>& par) const;

    // Gaussian profile log-likelihood, -n/2 (ln(2 pi RSS / n) + 1).
    double log_likelihood(const std::vector<double>& par) const;

    std::vector<double> predict(const std::vector<double>& par) const;

    std::size_t n_measured() const { return n_; }
    const models::ModelSpec& model() const { return model_; }

private:
    double mean_squared_error(const std::vector<double>& par) const;

    const models::ModelSpec& model_;
    const FlatData& data_;
    std::size_t n_ = 0;
};

} // namespace pheno::calib
