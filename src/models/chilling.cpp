#include "libpheno/models/phenology.hpp"

#include "accumulate.hpp"

#include <algorithm>
#include <cmath>

namespace pheno::models {

namespace {

// Triangular chilling response, zero outside (T_min, T_max).
double chill_rate(double T, double T_min, double T_opt, double T_max) {
    if (T <= T_min || T >= T_max) {
        return 0.0;
    }
    if (T <= T_opt) {
        return (T - T_min) / (T_opt - T_min);
    }
    return (T - T_max) / (T_opt - T_max);
}

} // namespace

std::vector<double> alternating(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("AT", par, 5);
    detail::check_drivers("AT", data);
    const std::size_t t0 = detail::start_index(par[0], data.n_days);
    const double T_base = par[1];
    const double a = par[2];
    const double b = par[3];
    const double c = par[4];

    std::vector<double> out(data.n_records, kNoTransition);
    for (std::size_t r = 0; r < data.n_records; ++r) {
        double chill_days = 0.0;
        double forcing = 0.0;
        for (std::size_t d = t0; d < data.n_days; ++d) {
            const double T = data.Ti(d, r);
            if (T < T_base) {
                chill_days += 1.0;
            } else {
                forcing += T - T_base;
            }
            if (forcing >= a + b * std::exp(c * chill_days)) {
                out[r] = static_cast<double>(data.doy[d]);
                break;
            }
        }
    }
    return out;
}

std::vector<double> sequential(const std::vector<double>& par, const FlatData& data) {
    detail::check_params("SQ", par, 7);
    detail::check_drivers("SQ", data);
    const std::size_t t0_chill = detail::start_index(par[0], data.n_days);
    const double T_base = par[1];
    const double T_opt = par[2];
    const double T_min = par[3];
    const double T_max = par[4];
    const double C_req = par[5];
    const double F_crit = par[6];

    std::vector<double> out(data.n_records, kNoTransition);
    if (!(T_min < T_opt && T_opt < T_max)) {
        return out;
    }

    for (std::size_t r = 0; r < data.n_records; ++r) {
        double chill = 0.0;
        double forcing = 0.0;
        bool chilled = false;
        for (std::size_t d = t0_chill; d < data.n_days; ++d) {
            const double T = data.Ti(d, r);
            if (!chilled) {
                chill += chill_rate(T, T_min, T_opt, T_max);
                chilled = chill >= C_req;
                continue;
            }
            forcing += std::max(0.0, T - T_base);
            if (forcing >= F_crit) {
                out[r] = static_cast<double>(data.doy[d]);
                break;
            }
        }
    }
    return out;
}

} // namespace pheno::models
