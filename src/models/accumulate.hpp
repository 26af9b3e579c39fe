#pragma once

#include "libpheno/core/errors.hpp"
#include "libpheno/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace pheno::models::detail {

inline void check_params(const char* model, const std::vector<double>& par, std::size_t expected) {
    if (par.size() != expected) {
        throw EvaluationError(std::string(model) + ": expected " + std::to_string(expected) +
                              " parameters, got " + std::to_string(par.size()));
    }
    for (std::size_t i = 0; i < par.size(); ++i) {
        if (!std::isfinite(par[i])) {
            throw EvaluationError(std::string(model) + ": parameter " + std::to_string(i + 1) +
                                  " is not finite");
        }
    }
}

inline void check_drivers(const char* model, const FlatData& data) {
    const std::size_t cells = data.n_days * data.n_records;
    if (data.doy.size() != data.n_days || data.temperature.size() != cells ||
        data.daylength.size() != cells) {
        throw EvaluationError(std::string(model) + ": driver data does not match the doy axis");
    }
}

// Index of the first day accumulation is allowed on.
inline std::size_t start_index(double t0, std::size_t n_days) {
    const double r = std::round(t0);
    if (r <= 0.0) {
        return 0;
    }
    return std::min(static_cast<std::size_t>(r), n_days);
}

inline double sigmoid(double b, double c, double T) {
    return 1.0 / (1.0 + std::exp(-b * (T - c)));
}

// For each record, accumulates rate(day, record) from index t0 and returns
// the doy at which the running sum first reaches `critical`.
template <typename Rate>
std::vector<double> accumulate_to_threshold(const FlatData& data,
                                            std::size_t t0,
                                            double critical,
                                            Rate rate) {
    std::vector<double> out(data.n_records, kNoTransition);
    for (std::size_t r = 0; r < data.n_records; ++r) {
        double sum = 0.0;
        for (std::size_t d = 0; d < data.n_days; ++d) {
            if (d >= t0) {
                sum += rate(d, r);
            }
            if (sum >= critical) {
                out[r] = static_cast<double>(data.doy[d]);
                break;
            }
        }
    }
    return out;
}

} // namespace pheno::models::detail
