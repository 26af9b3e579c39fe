#include <catch2/catch_all.hpp>

#include "libpheno/calib/local_search.hpp"

#include <cmath>
#include <vector>

using Catch::Approx;

TEST_CASE("Projected gradient descent minimizes convex quadratic", "[local]") {
    const pheno::calib::ObjectiveGrad f = [](const std::vector<double>& theta, double& obj, std::vector<double>& g) {
        const double x = theta[0];
        const double y = theta[1];
        obj = 0.5 * ((x - 0.5) * (x - 0.5) + 4.0 * (y + 0.25) * (y + 0.25));
        g.assign(2, 0.0);
        g[0] = (x - 0.5);
        g[1] = 4.0 * (y + 0.25);
    };

    const auto res = pheno::calib::projected_gradient_descent({-1.5, 1.2}, {-2.0, -2.0}, {2.0, 2.0}, f,
                                                              2000, 1e-10, 0.1);
    REQUIRE(res.converged);
    REQUIRE(res.x.size() == 2);
    CHECK(res.x[0] == Approx(0.5).margin(1e-6));
    CHECK(res.x[1] == Approx(-0.25).margin(1e-6));
    CHECK(res.grad_norm < 1e-6);
}

TEST_CASE("Projected gradient descent stops on the active bound", "[local][edge]") {
    const pheno::calib::ObjectiveGrad f = [](const std::vector<double>& theta, double& obj, std::vector<double>& g) {
        obj = (theta[0] - 3.0) * (theta[0] - 3.0);
        g.assign(1, 2.0 * (theta[0] - 3.0));
    };
    const auto res = pheno::calib::projected_gradient_descent({0.0}, {-1.0}, {1.0}, f, 200, 1e-10, 0.1);
    CHECK(res.x[0] == Approx(1.0));
    CHECK(res.obj == Approx(4.0));
}

TEST_CASE("Finite-difference refinement respects the evaluation budget", "[local]") {
    std::size_t calls = 0;
    const pheno::calib::Objective f = [&calls](const std::vector<double>& x) {
        ++calls;
        return (x[0] - 1.0) * (x[0] - 1.0) + 2.0 * (x[1] + 2.0) * (x[1] + 2.0);
    };

    pheno::calib::LocalSearchConfig cfg;
    cfg.max_iters = 500;
    cfg.grad_tol = 1e-8;

    std::size_t used = 0;
    const auto res = pheno::calib::refine(f, {0.0, 0.0}, {-5.0, -5.0}, {5.0, 5.0}, cfg, 200, used);
    CHECK(used == calls);
    CHECK(used <= 200);
    CHECK(res.obj < f({0.0, 0.0}));

    calls = 0;
    const auto big = pheno::calib::refine(f, {0.0, 0.0}, {-5.0, -5.0}, {5.0, 5.0}, cfg, 20000, used);
    CHECK(big.x[0] == Approx(1.0).margin(1e-3));
    CHECK(big.x[1] == Approx(-2.0).margin(1e-3));

    // too small to take a single step
    const auto none = pheno::calib::refine(f, {0.0, 0.0}, {-5.0, -5.0}, {5.0, 5.0}, cfg, 5, used);
    CHECK(used == 0);
    CHECK(std::isinf(none.obj));
}
