#pragma once

#include <cstddef>
#include <vector>

namespace pheno::stats {

struct AicRecord {
    std::size_t n = 0;      // valid (measured, predicted) pairs
    std::size_t k = 0;      // fitted parameters
    double rss = 0.0;
    double aic = 0.0;
    double aicc = 0.0;
    double correction = 0.0;  // aicc - aic; infinite when n <= k + 1
};

struct LinearFit {
    double intercept = 0.0;
    double slope = 0.0;
    double r_squared = 0.0;
    std::size_t n = 0;
};

// Missing (non-finite) measured values are excluded from every statistic
// below. Length mismatches throw std::invalid_argument; an empty valid
// set throws InsufficientDataError.
double rmse(const std::vector<double>& measured, const std::vector<double>& predicted);

// round(mean(measured)).
double null_prediction(const std::vector<double>& measured);

double null_rmse(const std::vector<double>& measured);

// AIC = n ln(RSS / n) + 2k, AICc = AIC + 2k(k + 1) / (n - k - 1).
// A perfect fit (RSS = 0) gives AIC = AICc = -inf.
AicRecord aicc(const std::vector<double>& measured,
               const std::vector<double>& predicted,
               std::size_t k);

// Ordinary least squares of y on x over pairs where both are finite.
LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y);

} // namespace pheno::stats
