#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace pheno::calib {

using Objective = std::function<double(const std::vector<double>&)>;
using ObjectiveGrad = std::function<void(const std::vector<double>&, double&, std::vector<double>&)>;

struct LocalSearchConfig {
    int max_iters = 100;
    double grad_tol = 1e-6;
    double fd_step = 1e-4;      // relative central-difference step
    double initial_step = 1e-1;
};

struct LocalResult {
    std::vector<double> x;
    double obj = 0.0;
    int iters = 0;
    double grad_norm = 0.0;
    bool converged = false;
};

LocalResult projected_gradient_descent(
    const std::vector<double>& x0,
    const std::vector<double>& lb,
    const std::vector<double>& ub,
    const ObjectiveGrad& f_grad,
    int maxit = 500, double tol = 1e-8, double alpha0 = 1e-1);

// Wraps a scalar objective with a central finite-difference gradient that
// never steps outside [lb, ub]. Each call costs 1 + 2n evaluations.
ObjectiveGrad finite_difference(const Objective& f,
                                const std::vector<double>& lb,
                                const std::vector<double>& ub,
                                double rel_step = 1e-4);

// Derivative-based refinement of a candidate. Stops before exceeding
// `max_evaluations` objective calls; `evaluations` receives the count used.
LocalResult refine(const Objective& f,
                   const std::vector<double>& x0,
                   const std::vector<double>& lb,
                   const std::vector<double>& ub,
                   const LocalSearchConfig& cfg,
                   std::size_t max_evaluations,
                   std::size_t& evaluations);

} // namespace pheno::calib
