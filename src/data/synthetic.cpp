#include "libpheno/data/synthetic.hpp"

#include "libpheno/core/errors.hpp"
#include "libpheno/data/dataset.hpp"

#include <cmath>
#include <random>
#include <string>
#include <utility>

namespace pheno::data {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr int SPRING_CROSSING_DOY = 105;

} // namespace

Dataset synthetic_drivers(const SyntheticConfig& cfg) {
    if (cfg.last_doy < cfg.first_doy) {
        throw ConfigurationError("synthetic_drivers: last_doy before first_doy");
    }
    if (cfg.sites == 0 || cfg.years < 1) {
        throw ConfigurationError("synthetic_drivers: need at least one site and one year");
    }

    std::mt19937_64 rng(cfg.seed);
    std::normal_distribution<double> Z(0.0, 1.0);

    Dataset data;
    for (int d = cfg.first_doy; d <= cfg.last_doy; ++d) {
        data.doy.push_back(d);
    }

    for (std::size_t s = 0; s < cfg.sites; ++s) {
        const double site_offset = cfg.site_sd * Z(rng);
        const double frac = (cfg.sites > 1) ? static_cast<double>(s) / static_cast<double>(cfg.sites - 1) : 0.5;
        const double latitude = cfg.latitude + cfg.latitude_spread * (2.0 * frac - 1.0);
        for (int y = 0; y < cfg.years; ++y) {
            SiteYear rec;
            rec.site = "site" + std::to_string(s + 1);
            rec.year = cfg.first_year + y;
            rec.latitude = latitude;
            const double year_offset = cfg.year_sd * Z(rng);
            rec.temperature.reserve(data.doy.size());
            for (int d : data.doy) {
                const double seasonal = cfg.amplitude * std::sin(2.0 * PI * (d - SPRING_CROSSING_DOY) / 365.0);
                rec.temperature.push_back(cfg.mean_temperature + site_offset + year_offset + seasonal +
                                          cfg.noise_sd * Z(rng));
            }
            data.records.push_back(std::move(rec));
        }
    }
    return data;
}

void assign_transition_dates(Dataset& data,
                             const models::ModelSpec& model,
                             const std::vector<double>& par,
                             double date_sd,
                             std::uint64_t seed) {
    const auto flat = flatten(data);
    const auto pred = models::predict(model, par, flat);

    std::mt19937_64 rng(seed);
    std::normal_distribution<double> Z(0.0, 1.0);
    for (std::size_t i = 0; i < data.records.size(); ++i) {
        const double noise = (date_sd > 0.0) ? std::round(date_sd * Z(rng)) : 0.0;
        data.records[i].transition_date = pred[i] + noise;
    }
}

} // namespace pheno::data
