#include "libpheno/data/dataset.hpp"

#include "libpheno/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace pheno::data {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG = PI / 180.0;
constexpr double SUNRISE_ANGLE = 0.8333;

std::string record_label(const SiteYear& rec, std::size_t idx) {
    std::ostringstream oss;
    oss << "record " << idx;
    if (!rec.site.empty()) {
        oss << " (" << rec.site << ", " << rec.year << ")";
    }
    return oss.str();
}

} // namespace

double daylength(int doy, double latitude) {
    const int J = (doy <= 0) ? doy + 365 : doy;
    const double theta = 0.2163108 + 2.0 * std::atan(0.9671396 * std::tan(0.00860 * (J - 186)));
    const double phi = std::asin(0.39795 * std::cos(theta));
    const double num = std::sin(SUNRISE_ANGLE * DEG) + std::sin(latitude * DEG) * std::sin(phi);
    const double den = std::cos(latitude * DEG) * std::cos(phi);
    const double arg = std::clamp(num / den, -1.0, 1.0);
    return 24.0 - (24.0 / PI) * std::acos(arg);
}

std::vector<double> daylength_series(const std::vector<int>& doy, double latitude) {
    std::vector<double> out;
    out.reserve(doy.size());
    for (int d : doy) {
        out.push_back(daylength(d, latitude));
    }
    return out;
}

FlatData flatten(const Dataset& data) {
    if (data.doy.empty()) {
        throw ConfigurationError("flatten: dataset has an empty doy axis");
    }

    FlatData flat;
    flat.doy = data.doy;
    flat.n_days = data.doy.size();
    flat.n_records = data.records.size();
    flat.temperature.reserve(flat.n_days * flat.n_records);
    flat.daylength.reserve(flat.n_days * flat.n_records);
    flat.transition_dates.reserve(flat.n_records);
    flat.site.reserve(flat.n_records);
    flat.year.reserve(flat.n_records);

    for (std::size_t r = 0; r < data.records.size(); ++r) {
        const auto& rec = data.records[r];
        if (rec.temperature.size() != flat.n_days) {
            throw ConfigurationError("flatten: temperature series of " + record_label(rec, r) +
                                     " does not match the doy axis");
        }
        flat.temperature.insert(flat.temperature.end(), rec.temperature.begin(), rec.temperature.end());

        if (rec.daylength.empty()) {
            const auto L = daylength_series(data.doy, rec.latitude);
            flat.daylength.insert(flat.daylength.end(), L.begin(), L.end());
        } else if (rec.daylength.size() == flat.n_days) {
            flat.daylength.insert(flat.daylength.end(), rec.daylength.begin(), rec.daylength.end());
        } else {
            throw ConfigurationError("flatten: daylength series of " + record_label(rec, r) +
                                     " does not match the doy axis");
        }

        flat.transition_dates.push_back(rec.transition_date);
        flat.site.push_back(rec.site);
        flat.year.push_back(rec.year);
    }
    return flat;
}

std::size_t count_measured(const std::vector<double>& measured) {
    return static_cast<std::size_t>(std::count_if(measured.begin(), measured.end(),
        [](double v) { return std::isfinite(v); }));
}

} // namespace pheno::data
