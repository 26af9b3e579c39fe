#include "libpheno/calib/local_search.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pheno::calib {

namespace {

double grad_norm(const std::vector<double>& g) {
    double n2 = 0.0;
    for (double v : g) n2 += v * v;
    return std::sqrt(n2);
}

} // namespace

// Projected gradient descent with a simple backtracking line search.
LocalResult projected_gradient_descent(
    const std::vector<double>& x0,
    const std::vector<double>& lb,
    const std::vector<double>& ub,
    const ObjectiveGrad& f_grad,
    int maxit,
    double tol,
    double alpha0)
{
    const int n = static_cast<int>(x0.size());
    std::vector<double> x = x0;
    std::vector<double> g(n, 0.0);

    auto project = [&](std::vector<double>& v){
        for (int i = 0; i < n; ++i) {
            double lo = (i < (int)lb.size() ? lb[i] : -std::numeric_limits<double>::infinity());
            double hi = (i < (int)ub.size() ? ub[i] : std::numeric_limits<double>::infinity());
            if (v[i] < lo) v[i] = lo;
            if (v[i] > hi) v[i] = hi;
        }
    };

    double f = 0.0;
    project(x);
    f_grad(x, f, g);

    double best_f = f;
    std::vector<double> best_x = x;
    double best_grad = grad_norm(g);

    double alpha = alpha0;
    for (int it = 0; it < maxit; ++it) {
        const double gn = grad_norm(g);
        if (gn < tol) {
            return { x, f, it + 1, gn, true };
        }

        std::vector<double> x_new(n);
        for (int i = 0; i < n; ++i) {
            x_new[i] = x[i] - alpha * g[i];
        }
        project(x_new);

        double f_new = 0.0;
        std::vector<double> g_new;
        f_grad(x_new, f_new, g_new);

        if (f_new < f) {
            x = std::move(x_new);
            g = std::move(g_new);
            f = f_new;
            if (f < best_f) {
                best_f = f;
                best_x = x;
                best_grad = grad_norm(g);
            }
            alpha = std::min(1.0, alpha * 1.2);
        } else {
            // step too big, shrink
            alpha *= 0.5;
            if (alpha < 1e-10) {
                break;
            }
        }
    }

    return { best_x, best_f, maxit, best_grad, false };
}

ObjectiveGrad finite_difference(const Objective& f,
                                const std::vector<double>& lb,
                                const std::vector<double>& ub,
                                double rel_step) {
    return [f, lb, ub, rel_step](const std::vector<double>& x, double& obj, std::vector<double>& g) {
        obj = f(x);
        const std::size_t n = x.size();
        g.assign(n, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            const double span = rel_step * std::max(1.0, std::abs(x[i]));
            std::vector<double> xp = x;
            std::vector<double> xm = x;
            xp[i] = std::min(ub[i], x[i] + span);
            xm[i] = std::max(lb[i], x[i] - span);
            const double delta = xp[i] - xm[i];
            if (delta == 0.0) {
                continue;
            }
            g[i] = (f(xp) - f(xm)) / delta;
        }
    };
}

LocalResult refine(const Objective& f,
                   const std::vector<double>& x0,
                   const std::vector<double>& lb,
                   const std::vector<double>& ub,
                   const LocalSearchConfig& cfg,
                   std::size_t max_evaluations,
                   std::size_t& evaluations) {
    evaluations = 0;
    const std::size_t per_call = 1 + 2 * x0.size();
    const std::size_t calls = max_evaluations / per_call;
    if (calls < 2) {
        return { x0, std::numeric_limits<double>::infinity(), 0, 0.0, false };
    }
    const int maxit = std::min(cfg.max_iters, static_cast<int>(calls - 1));

    Objective counted = [&f, &evaluations](const std::vector<double>& x) {
        ++evaluations;
        return f(x);
    };
    return projected_gradient_descent(x0, lb, ub, finite_difference(counted, lb, ub, cfg.fd_step),
                                      maxit, cfg.grad_tol, cfg.initial_step);
}

} // namespace pheno::calib
