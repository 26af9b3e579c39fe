#include "libpheno/stats/metrics.hpp"

#include "libpheno/core/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace pheno::stats {

namespace {

void check_sizes(const char* fn, const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(std::string(fn) + ": measured and predicted differ in length");
    }
}

struct Residuals {
    double rss = 0.0;
    std::size_t n = 0;
};

Residuals residuals(const std::vector<double>& measured, const std::vector<double>& predicted) {
    Residuals out;
    for (std::size_t i = 0; i < measured.size(); ++i) {
        if (!std::isfinite(measured[i])) {
            continue;
        }
        const double e = predicted[i] - measured[i];
        out.rss += e * e;
        ++out.n;
    }
    return out;
}

} // namespace

double rmse(const std::vector<double>& measured, const std::vector<double>& predicted) {
    check_sizes("rmse", measured, predicted);
    const auto res = residuals(measured, predicted);
    if (res.n == 0) {
        throw InsufficientDataError("rmse: no measured values");
    }
    return std::sqrt(res.rss / static_cast<double>(res.n));
}

double null_prediction(const std::vector<double>& measured) {
    double sum = 0.0;
    std::size_t n = 0;
    for (double v : measured) {
        if (std::isfinite(v)) {
            sum += v;
            ++n;
        }
    }
    if (n == 0) {
        throw InsufficientDataError("null_prediction: no measured values");
    }
    return std::round(sum / static_cast<double>(n));
}

double null_rmse(const std::vector<double>& measured) {
    const std::vector<double> baseline(measured.size(), null_prediction(measured));
    return rmse(measured, baseline);
}

AicRecord aicc(const std::vector<double>& measured,
               const std::vector<double>& predicted,
               std::size_t k) {
    check_sizes("aicc", measured, predicted);
    const auto res = residuals(measured, predicted);
    if (res.n == 0) {
        throw InsufficientDataError("aicc: no measured values");
    }

    AicRecord out;
    out.n = res.n;
    out.k = k;
    out.rss = res.rss;

    const double n = static_cast<double>(res.n);
    const double kd = static_cast<double>(k);
    out.aic = n * std::log(res.rss / n) + 2.0 * kd;

    const double dof = n - kd - 1.0;
    out.correction = (dof > 0.0) ? (2.0 * kd * (kd + 1.0)) / dof
                                 : std::numeric_limits<double>::infinity();
    out.aicc = out.aic + out.correction;
    return out;
}

LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y) {
    check_sizes("linear_fit", x, y);
    double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0, syy = 0.0;
    std::size_t n = 0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            continue;
        }
        sx  += x[i];
        sy  += y[i];
        sxx += x[i] * x[i];
        sxy += x[i] * y[i];
        syy += y[i] * y[i];
        ++n;
    }
    if (n == 0) {
        throw InsufficientDataError("linear_fit: no complete pairs");
    }

    LinearFit fit;
    fit.n = n;
    const double nd = static_cast<double>(n);
    const double vx = nd * sxx - sx * sx;
    const double vy = nd * syy - sy * sy;
    const double cxy = nd * sxy - sx * sy;
    if (std::abs(vx) > 0.0) {
        fit.slope = cxy / vx;
        fit.intercept = (sy - fit.slope * sx) / nd;
        fit.r_squared = (std::abs(vy) > 0.0) ? (cxy * cxy) / (vx * vy) : 1.0;
    } else {
        // constant predictor: intercept only
        fit.slope = 0.0;
        fit.intercept = sy / nd;
        fit.r_squared = 0.0;
    }
    return fit;
}

} // namespace pheno::stats
