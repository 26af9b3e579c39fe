#pragma once

#include "libpheno/core/types.hpp"

#include <cstddef>
#include <vector>

namespace pheno::data {

// Hours of daylight at day-of-year `doy` and latitude (degrees), CBM model
// (Forsythe et al. 1995). Non-positive doy refers to the previous year.
double daylength(int doy, double latitude);

std::vector<double> daylength_series(const std::vector<int>& doy, double latitude);

// Throws ConfigurationError if a driver series does not match the doy axis.
FlatData flatten(const Dataset& data);

std::size_t count_measured(const std::vector<double>& measured);

} // namespace pheno::data
