#include "libpheno/models/phenology.hpp"

#include "accumulate.hpp"
#include "libpheno/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace pheno::models {

namespace {

constexpr int SPRING_FIRST_DOY = 60;
constexpr int SPRING_LAST_DOY = 151;

} // namespace

std::vector<double> null_model(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("NULL", par, 0);

    double sum = 0.0;
    std::size_t n = 0;
    for (double v : data.transition_dates) {
        if (std::isfinite(v)) {
            sum += v;
            ++n;
        }
    }
    if (n == 0) {
        throw InsufficientDataError("NULL: no measured transition dates");
    }
    return std::vector<double>(data.n_records, std::round(sum / static_cast<double>(n)));
}

std::vector<double> linear(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("LIN", par, 2);
    detail::check_drivers("LIN", data);
    const double a = par[0];
    const double b = par[1];

    std::vector<std::size_t> window;
    for (std::size_t d = 0; d < data.n_days; ++d) {
        if (data.doy[d] >= SPRING_FIRST_DOY && data.doy[d] <= SPRING_LAST_DOY) {
            window.push_back(d);
        }
    }
    if (window.empty()) {
        throw EvaluationError("LIN: doy axis does not cover the spring window");
    }

    std::vector<double> out(data.n_records);
    for (std::size_t r = 0; r < data.n_records; ++r) {
        double sum = 0.0;
        for (std::size_t d : window) {
            sum += data.Ti(d, r);
        }
        out[r] = a * (sum / static_cast<double>(window.size())) + b;
    }
    return out;
}

std::vector<double> thermal_time(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("TT", par, 3);
    detail::check_drivers("TT", data);
    const double T_base = par[1];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[2],
        [&](std::size_t d, std::size_t r) {
            return std::max(0.0, data.Ti(d, r) - T_base);
        });
}

std::vector<double> thermal_time_sigmoid(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("TTs", par, 4);
    detail::check_drivers("TTs", data);
    const double b = par[1];
    const double c = par[2];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[3],
        [&](std::size_t d, std::size_t r) {
            return detail::sigmoid(b, c, data.Ti(d, r));
        });
}

std::vector<double> photo_thermal_time(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("PTT", par, 3);
    detail::check_drivers("PTT", data);
    const double T_base = par[1];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[2],
        [&](std::size_t d, std::size_t r) {
            return std::max(0.0, data.Ti(d, r) - T_base) * data.Li(d, r) / 24.0;
        });
}

std::vector<double> photo_thermal_time_sigmoid(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("PTTs", par, 4);
    detail::check_drivers("PTTs", data);
    const double b = par[1];
    const double c = par[2];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[3],
        [&](std::size_t d, std::size_t r) {
            return detail::sigmoid(b, c, data.Ti(d, r)) * data.Li(d, r) / 24.0;
        });
}

std::vector<double> m1(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("M1", par, 4);
    detail::check_drivers("M1", data);
    const double T_base = par[1];
    const double k = par[2];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[3],
        [&](std::size_t d, std::size_t r) {
            return std::pow(data.Li(d, r) / 10.0, k) * std::max(0.0, data.Ti(d, r) - T_base);
        });
}

std::vector<double> m1_sigmoid(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("M1s", par, 5);
    detail::check_drivers("M1s", data);
    const double b = par[1];
    const double c = par[2];
    const double k = par[3];
    return detail::accumulate_to_threshold(data, detail::start_index(par[0], data.n_days), par[4],
        [&](std::size_t d, std::size_t r) {
            return std::pow(data.Li(d, r) / 24.0, k) * detail::sigmoid(b, c, data.Ti(d, r));
        });
}

} // namespace pheno::models
