#pragma once

#include "libpheno/core/types.hpp"
#include "libpheno/models/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pheno::data {

struct SyntheticConfig {
    std::size_t sites = 5;
    int first_year = 2001;
    int years = 6;
    int first_doy = -110;
    int last_doy = 254;
    double mean_temperature = 8.0;
    double amplitude = 12.0;        // seasonal half-range
    double site_sd = 1.5;           // per-site offset of the mean
    double year_sd = 1.0;           // per-site-year offset of the mean
    double noise_sd = 2.0;          // daily weather noise
    double latitude = 45.0;
    double latitude_spread = 5.0;   // sites spaced evenly over +/- spread
    std::uint64_t seed = 7;
};

// Sinusoidal temperature series with site, year and daily noise; daylength
// left empty (derived from latitude on flatten). Transition dates missing.
Dataset synthetic_drivers(const SyntheticConfig& cfg);

// Sets each record's transition date to the model's prediction plus
// rounded Gaussian noise of standard deviation `date_sd`.
void assign_transition_dates(Dataset& data,
                             const models::ModelSpec& model,
                             const std::vector<double>& par,
                             double date_sd = 0.0,
                             std::uint64_t seed = 11);

} // namespace pheno::data
