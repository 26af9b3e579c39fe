#include <catch2/catch_all.hpp>

#include "libpheno/core/errors.hpp"
#include "libpheno/core/types.hpp"
#include "libpheno/stats/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using Catch::Approx;

TEST_CASE("RMSE is zero only for an exact fit", "[stats]") {
    const std::vector<double> measured{120.0, 118.0, 125.0, 130.0};
    REQUIRE(pheno::stats::rmse(measured, measured) == 0.0);

    const std::vector<double> off{121.0, 118.0, 125.0, 130.0};
    const double e = pheno::stats::rmse(measured, off);
    REQUIRE(e > 0.0);
    CHECK(e == Approx(0.5));
}

TEST_CASE("RMSE skips records with a missing measured date", "[stats]") {
    const std::vector<double> measured{120.0, pheno::kMissing, 124.0};
    const std::vector<double> predicted{122.0, 9999.0, 120.0};
    // sqrt((4 + 16) / 2)
    CHECK(pheno::stats::rmse(measured, predicted) == Approx(std::sqrt(10.0)));
}

TEST_CASE("RMSE rejects mismatched or empty input", "[stats][edge]") {
    const std::vector<double> measured{120.0, 118.0};
    const std::vector<double> shorter{120.0};
    CHECK_THROWS_AS(pheno::stats::rmse(measured, shorter), std::invalid_argument);

    const std::vector<double> unmeasured{pheno::kMissing, pheno::kMissing};
    CHECK_THROWS_AS(pheno::stats::rmse(unmeasured, measured), pheno::InsufficientDataError);
    CHECK_THROWS_AS(pheno::stats::null_rmse(unmeasured), pheno::InsufficientDataError);
}

TEST_CASE("Null model predicts the rounded mean", "[stats]") {
    const std::vector<double> measured{120.0, 121.0, pheno::kMissing, 124.0};
    // mean 121.667
    CHECK(pheno::stats::null_prediction(measured) == 122.0);
    const double expected = std::sqrt((4.0 + 1.0 + 4.0) / 3.0);
    CHECK(pheno::stats::null_rmse(measured) == Approx(expected));
}

TEST_CASE("AICc correction vanishes as n grows", "[stats][aic]") {
    auto make = [](std::size_t n) {
        std::vector<double> measured(n), predicted(n);
        for (std::size_t i = 0; i < n; ++i) {
            measured[i] = 100.0 + static_cast<double>(i % 20);
            predicted[i] = measured[i] + ((i % 2 == 0) ? 1.0 : -1.0);
        }
        return std::make_pair(measured, predicted);
    };

    const auto [m500, p500] = make(500);
    const auto [m5000, p5000] = make(5000);
    const auto small = pheno::stats::aicc(m500, p500, 3);
    const auto large = pheno::stats::aicc(m5000, p5000, 3);

    CHECK(small.n == 500);
    CHECK(small.rss == Approx(500.0));
    CHECK(small.aic == Approx(500.0 * std::log(1.0) + 6.0));
    CHECK(small.correction == Approx(24.0 / 496.0));
    CHECK(large.correction == Approx(24.0 / 4996.0));
    CHECK(large.correction < small.correction);
    CHECK(small.aicc - small.aic == Approx(small.correction));
}

TEST_CASE("AICc correction is infinite when n <= k + 1", "[stats][aic][edge]") {
    const std::vector<double> measured{120.0, 125.0, 130.0};
    const std::vector<double> predicted{121.0, 124.0, 131.0};
    const auto rec = pheno::stats::aicc(measured, predicted, 2);
    CHECK(std::isfinite(rec.aic));
    CHECK(std::isinf(rec.correction));
    CHECK(std::isinf(rec.aicc));
}

TEST_CASE("Linear fit recovers slope and intercept", "[stats]") {
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0, pheno::kMissing};
    const std::vector<double> y{3.0, 5.0, 7.0, 9.0, 11.0};
    const auto fit = pheno::stats::linear_fit(x, y);
    CHECK(fit.n == 4);
    CHECK(fit.slope == Approx(2.0));
    CHECK(fit.intercept == Approx(1.0));
    CHECK(fit.r_squared == Approx(1.0));
}

TEST_CASE("Perfect fit gives an infinitely negative AIC", "[stats][aic][edge]") {
    const std::vector<double> measured{120.0, 125.0, 130.0, 118.0, 122.0, 127.0};
    const auto rec = pheno::stats::aicc(measured, measured, 2);
    CHECK(rec.rss == 0.0);
    CHECK(std::isinf(rec.aic));
    CHECK(rec.aic < 0.0);
    CHECK(std::isinf(rec.aicc));
    CHECK(rec.aicc < 0.0);
    CHECK(std::isfinite(rec.correction));
}
