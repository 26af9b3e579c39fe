#pragma once

#include "libpheno/core/types.hpp"

#include <vector>

// Spring phenology models. Each returns one predicted transition DOY per
// record of `data`, kNoTransition where the critical state is never
// reached. t0 parameters are indices into the doy axis; forcing and
// chilling accumulate from that index on. All evaluators throw
// EvaluationError on a parameter vector of the wrong arity or with
// non-finite entries.
namespace pheno::models {

// round(mean(measured)) for every record.
std::vector<double> null_model(const std::vector<double>& par, const FlatData& data);

// a * mean spring (DOY 60-151) temperature + b
std::vector<double> linear(const std::vector<double>& par, const FlatData& data);

// Thermal time: t0, T_base, F_crit
std::vector<double> thermal_time(const std::vector<double>& par, const FlatData& data);

// Thermal time, sigmoid forcing: t0, b, c, F_crit
std::vector<double> thermal_time_sigmoid(const std::vector<double>& par, const FlatData& data);

// Photo-thermal time: t0, T_base, F_crit
std::vector<double> photo_thermal_time(const std::vector<double>& par, const FlatData& data);

// Photo-thermal time, sigmoid forcing: t0, b, c, F_crit
std::vector<double> photo_thermal_time_sigmoid(const std::vector<double>& par, const FlatData& data);

// M1 (Blumel & Chmielewski 2012): t0, T_base, k, F_crit
std::vector<double> m1(const std::vector<double>& par, const FlatData& data);

// M1, sigmoid forcing: t0, b, c, k, F_crit
std::vector<double> m1_sigmoid(const std::vector<double>& par, const FlatData& data);

// Alternating model: t0, T_base, a, b, c
std::vector<double> alternating(const std::vector<double>& par, const FlatData& data);

// Sequential chilling/forcing model:
// t0_chill, T_base, T_opt, T_min, T_max, C_req, F_crit
std::vector<double> sequential(const std::vector<double>& par, const FlatData& data);

} // namespace pheno::models
