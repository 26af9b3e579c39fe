#include <catch2/catch_all.hpp>

#include "libpheno/calib/calibrator.hpp"
#include "libpheno/core/errors.hpp"
#include "libpheno/data/dataset.hpp"
#include "libpheno/data/synthetic.hpp"
#include "libpheno/models/phenology.hpp"

#include <cmath>
#include <vector>

using Catch::Approx;

namespace {

const std::vector<double> kTruth{90.0, 4.0, 180.0};

pheno::Dataset thermal_time_sites() {
    pheno::data::SyntheticConfig cfg;
    cfg.sites = 5;
    cfg.years = 4;
    auto data = pheno::data::synthetic_drivers(cfg);
    pheno::data::assign_transition_dates(data, pheno::models::ModelRegistry::builtin().find("TT"), kTruth);
    return data;
}

pheno::calib::OptimizerControl quick_control() {
    pheno::calib::OptimizerControl control;
    control.max_calls = 1500;
    control.seed = 20241123u;
    control.genetic.pop_size = 40;
    control.sampler.iterations = 2000;
    control.sampler.burn_in = 500;
    return control;
}

} // namespace

TEST_CASE("Thermal time calibration recovers synthetic dates", "[calibration]") {
    const auto data = thermal_time_sites();
    pheno::data::ParameterRangeTable ranges;
    ranges.add("TT", {{"t0", 80.0, 100.0}, {"T_base", 3.0, 5.0}, {"F_crit", 150.0, 210.0}});

    const auto fit = pheno::calib::calibrate("TT", data, pheno::calib::Method::SimulatedAnnealing,
                                             quick_control(), ranges);

    REQUIRE(fit.params.size() == 3);
    for (std::size_t i = 0; i < 3; ++i) {
        CHECK(fit.params[i] >= fit.bounds[i].lower);
        CHECK(fit.params[i] <= fit.bounds[i].upper);
    }
    CHECK(fit.bounds[1].name == "T_base");
    REQUIRE(fit.measured.size() == 20);
    REQUIRE(fit.predicted.size() == 20);
    CHECK(fit.rmse == Approx(pheno::stats::rmse(fit.measured, fit.predicted)));
    CHECK(fit.rmse == Approx(pheno::stats::rmse(fit.measured,
        pheno::models::thermal_time(fit.params, pheno::data::flatten(data)))));
    CHECK(fit.rmse_null == Approx(pheno::stats::null_rmse(fit.measured)));
    CHECK(fit.rmse < fit.rmse_null);
    CHECK(fit.aic.n == 20);
    CHECK(fit.aic.k == 3);
    CHECK(fit.optimizer.evaluations() <= 1500);
}

TEST_CASE("Degenerate bounds give the directly evaluated fit", "[calibration][edge]") {
    const auto data = thermal_time_sites();
    pheno::data::ParameterRangeTable ranges;
    ranges.add("TT", {{"t0", 90.0, 90.0}, {"T_base", 4.0, 4.0}, {"F_crit", 180.0, 180.0}});

    for (auto method : {pheno::calib::Method::SimulatedAnnealing,
                        pheno::calib::Method::Genetic,
                        pheno::calib::Method::Bayesian}) {
        INFO(pheno::calib::to_string(method));
        const auto fit = pheno::calib::calibrate("TT", data, method, quick_control(), ranges);
        CHECK(fit.params == kTruth);
        CHECK(fit.rmse == 0.0);
    }
}

TEST_CASE("Bayesian calibration carries the posterior sample", "[calibration][bayes]") {
    const auto data = thermal_time_sites();
    pheno::data::ParameterRangeTable ranges;
    ranges.add("TT", {{"t0", 80.0, 100.0}, {"T_base", 3.0, 5.0}, {"F_crit", 150.0, 210.0}});

    const auto fit = pheno::calib::calibrate("TT", data, pheno::calib::Method::Bayesian, quick_control(), ranges);
    CHECK(fit.method == pheno::calib::Method::Bayesian);
    const auto* post = fit.optimizer.posterior();
    REQUIRE(post != nullptr);
    CHECK_FALSE(post->samples.empty());
    CHECK(post->params == fit.params);
}

TEST_CASE("Configuration errors surface before any model evaluation", "[calibration][edge]") {
    std::size_t calls = 0;
    pheno::models::ModelRegistry registry;
    registry.add({"COUNT", {"c"}, [&calls](const std::vector<double>& par, const pheno::FlatData& data) {
        ++calls;
        return std::vector<double>(data.n_records, par.at(0));
    }, "counts evaluations"});

    const auto data = thermal_time_sites();
    const auto control = quick_control();

    SECTION("model missing from the parameter ranges") {
        pheno::data::ParameterRangeTable ranges;
        ranges.add("TT", {{"t0", 1.0, 200.0}, {"T_base", -5.0, 10.0}, {"F_crit", 0.0, 2000.0}});
        CHECK_THROWS_WITH(pheno::calib::calibrate("COUNT", data, pheno::calib::Method::SimulatedAnnealing,
                                                  control, ranges, registry),
                          Catch::Matchers::ContainsSubstring("model not found in parameter ranges"));
    }
    SECTION("model unknown to the registry") {
        pheno::data::ParameterRangeTable ranges;
        ranges.add("OTHER", {{"c", 0.0, 1.0}});
        CHECK_THROWS_AS(pheno::calib::calibrate("OTHER", data, pheno::calib::Method::Genetic,
                                                control, ranges, registry),
                        pheno::ConfigurationError);
    }
    SECTION("parameter count disagrees with the model") {
        pheno::data::ParameterRangeTable ranges;
        ranges.add("COUNT", {{"c", 0.0, 1.0}, {"d", 0.0, 1.0}});
        CHECK_THROWS_AS(pheno::calib::calibrate("COUNT", data, pheno::calib::Method::Bayesian,
                                                control, ranges, registry),
                        pheno::ConfigurationError);
    }
    CHECK(calls == 0);
}

TEST_CASE("Calibration without measured dates is refused", "[calibration][edge]") {
    auto data = thermal_time_sites();
    for (auto& rec : data.records) {
        rec.transition_date = pheno::kMissing;
    }
    pheno::data::ParameterRangeTable ranges;
    ranges.add("TT", {{"t0", 1.0, 200.0}, {"T_base", -5.0, 10.0}, {"F_crit", 0.0, 2000.0}});
    CHECK_THROWS_AS(pheno::calib::calibrate("TT", data, pheno::calib::Method::SimulatedAnnealing,
                                            quick_control(), ranges),
                    pheno::InsufficientDataError);
}

TEST_CASE("Records with missing dates are ignored by the fit", "[calibration]") {
    auto data = thermal_time_sites();
    data.records[0].transition_date = pheno::kMissing;
    data.records[3].transition_date = pheno::kMissing;
    pheno::data::ParameterRangeTable ranges;
    ranges.add("TT", {{"t0", 90.0, 90.0}, {"T_base", 4.0, 4.0}, {"F_crit", 180.0, 180.0}});

    const auto fit = pheno::calib::calibrate("TT", data, pheno::calib::Method::Genetic, quick_control(), ranges);
    CHECK(fit.aic.n == 18);
    CHECK(fit.rmse == 0.0);
    CHECK(std::isnan(fit.measured[0]));
    CHECK(std::isfinite(fit.predicted[0]));
}
