#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace pheno {

// Predicted date for a record whose threshold is never reached.
inline constexpr double kNoTransition = 9999.0;

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

struct ParameterSpec {
    std::string name;
    double lower;
    double upper;
};

struct SiteYear {
    std::string site;
    int year = 0;
    double latitude = 0.0;
    double transition_date = kMissing;  // DOY, NaN when not observed
    std::vector<double> temperature;    // daily mean, one value per doy
    std::vector<double> daylength;      // hours; derived from latitude when empty
};

struct Dataset {
    std::vector<int> doy;
    std::vector<SiteYear> records;
};

// Column-per-record layout consumed by the model evaluators.
struct FlatData {
    std::vector<int> doy;
    std::size_t n_days = 0;
    std::size_t n_records = 0;
    std::vector<double> temperature;    // n_days x n_records, record-major
    std::vector<double> daylength;      // same layout as temperature
    std::vector<double> transition_dates;
    std::vector<std::string> site;
    std::vector<int> year;

    double Ti(std::size_t day, std::size_t record) const {
        return temperature[record * n_days + day];
    }
    double Li(std::size_t day, std::size_t record) const {
        return daylength[record * n_days + day];
    }
};

} // namespace pheno
