#include <catch2/catch_all.hpp>

#include "libpheno/core/errors.hpp"
#include "libpheno/data/dataset.hpp"
#include "libpheno/models/phenology.hpp"
#include "libpheno/models/registry.hpp"

#include <cmath>
#include <vector>

using Catch::Approx;

namespace {

// Ten days, one record, temperatures rising by one degree a day from 4.
pheno::FlatData ramp(double daylength_hours) {
    pheno::Dataset ds;
    for (int d = 1; d <= 10; ++d) ds.doy.push_back(d);
    pheno::SiteYear rec;
    rec.site = "ramp";
    rec.year = 2001;
    rec.transition_date = 5.0;
    rec.temperature = {4, 6, 7, 8, 9, 10, 11, 12, 13, 14};
    rec.daylength.assign(ds.doy.size(), daylength_hours);
    ds.records.push_back(rec);
    return pheno::data::flatten(ds);
}

} // namespace

TEST_CASE("Thermal time matches hand accumulation", "[models]") {
    const auto data = ramp(12.0);
    // rates above 5: 0,1,2,3,4 -> sum hits 10 on the fifth day
    auto out = pheno::models::thermal_time({0.0, 5.0, 10.0}, data);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == 5.0);

    // start at index 2: 2,5,9,14
    out = pheno::models::thermal_time({2.0, 5.0, 10.0}, data);
    CHECK(out[0] == 6.0);

    out = pheno::models::thermal_time({0.0, 5.0, 1000.0}, data);
    CHECK(out[0] == pheno::kNoTransition);
}

TEST_CASE("Photoperiod terms reduce to thermal time", "[models]") {
    const std::vector<double> tt{0.0, 5.0, 10.0};
    const auto tt_out = pheno::models::thermal_time(tt, ramp(12.0));

    // L / 24 == 1
    CHECK(pheno::models::photo_thermal_time(tt, ramp(24.0)) == tt_out);
    // (L / 10)^k == 1
    CHECK(pheno::models::m1({0.0, 5.0, 3.7, 10.0}, ramp(10.0)) == tt_out);
}

TEST_CASE("Evaluators reject malformed parameter vectors", "[models][edge]") {
    const auto data = ramp(12.0);
    CHECK_THROWS_AS(pheno::models::thermal_time({0.0, 5.0}, data), pheno::EvaluationError);
    CHECK_THROWS_AS(pheno::models::sequential({0.0}, data), pheno::EvaluationError);
    CHECK_THROWS_AS(pheno::models::thermal_time({0.0, std::nan(""), 10.0}, data), pheno::EvaluationError);
}

TEST_CASE("Sequential model with unordered cardinal temperatures never transitions", "[models][edge]") {
    const auto data = ramp(12.0);
    // T_opt outside (T_min, T_max)
    const auto out = pheno::models::sequential({0.0, 0.0, 20.0, -5.0, 10.0, 1.0, 1.0}, data);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == pheno::kNoTransition);
}

TEST_CASE("Null model predicts the rounded mean of measured dates", "[models]") {
    pheno::Dataset ds;
    ds.doy = {1, 2, 3};
    for (double date : {100.0, 101.0, pheno::kMissing, 104.0}) {
        pheno::SiteYear rec;
        rec.latitude = 45.0;
        rec.transition_date = date;
        rec.temperature = {1.0, 2.0, 3.0};
        ds.records.push_back(rec);
    }
    const auto out = pheno::models::null_model({}, pheno::data::flatten(ds));
    REQUIRE(out.size() == 4);
    for (double v : out) CHECK(v == 102.0);
}

TEST_CASE("Linear model uses mean spring temperature", "[models]") {
    pheno::Dataset ds;
    for (int d = 1; d <= 200; ++d) ds.doy.push_back(d);
    pheno::SiteYear rec;
    rec.latitude = 45.0;
    rec.temperature.assign(ds.doy.size(), 10.0);
    ds.records.push_back(rec);

    const auto out = pheno::models::linear({-2.0, 150.0}, pheno::data::flatten(ds));
    REQUIRE(out.size() == 1);
    CHECK(out[0] == Approx(130.0));
}

TEST_CASE("Flatten validates driver lengths", "[models][data]") {
    pheno::Dataset ds;
    ds.doy = {1, 2, 3};
    pheno::SiteYear rec;
    rec.temperature = {1.0, 2.0};
    ds.records.push_back(rec);
    CHECK_THROWS_AS(pheno::data::flatten(ds), pheno::ConfigurationError);

    ds.records[0].temperature = {1.0, 2.0, 3.0};
    ds.records[0].daylength = {12.0};
    CHECK_THROWS_AS(pheno::data::flatten(ds), pheno::ConfigurationError);

    ds.records[0].daylength.clear();
    const auto flat = pheno::data::flatten(ds);
    CHECK(flat.daylength.size() == 3);
}

TEST_CASE("Daylength follows the seasons", "[data]") {
    CHECK(pheno::data::daylength(172, 45.0) > 15.0);
    CHECK(pheno::data::daylength(355, 45.0) < 9.5);
    CHECK(pheno::data::daylength(80, 0.0) == Approx(12.0).margin(0.25));
    // non-positive doy wraps to the previous year
    CHECK(pheno::data::daylength(-10, 45.0) == Approx(pheno::data::daylength(355, 45.0)));
}

TEST_CASE("Built-in registry lists every model", "[models][registry]") {
    const auto& reg = pheno::models::ModelRegistry::builtin();
    CHECK(reg.size() == 10);
    for (const char* name : {"NULL", "LIN", "TT", "TTs", "PTT", "PTTs", "M1", "M1s", "AT", "SQ"}) {
        INFO(name);
        CHECK(reg.contains(name));
    }
    CHECK(reg.find("SQ").parameters.size() == 7);
    CHECK_THROWS_AS(reg.find("XYZ"), pheno::ConfigurationError);
}

TEST_CASE("Custom registries validate their models", "[models][registry]") {
    pheno::models::ModelRegistry reg;
    auto constant = [](const std::vector<double>& par, const pheno::FlatData& data) {
        return std::vector<double>(data.n_records, par.at(0));
    };
    reg.add({"CONST", {"c"}, constant, "constant date"});
    CHECK_THROWS_AS(reg.add({"CONST", {"c"}, constant, ""}), pheno::ConfigurationError);
    CHECK_THROWS_AS(reg.add({"", {"c"}, constant, ""}), pheno::ConfigurationError);
    CHECK_THROWS_AS(reg.add({"EMPTY", {"c"}, nullptr, ""}), pheno::ConfigurationError);

    reg.add({"SHORT", {}, [](const std::vector<double>&, const pheno::FlatData&) {
        return std::vector<double>{};
    }, "wrong size"});
    const auto data = ramp(12.0);
    CHECK(pheno::models::predict(reg.find("CONST"), {120.0}, data) == std::vector<double>{120.0});
    CHECK_THROWS_AS(pheno::models::predict(reg.find("SHORT"), {}, data), pheno::EvaluationError);
}
