// === src/solvers/BoundedQuasiNewton.cpp ===
#include "mgwind/solvers/BoundedQuasiNewton.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace mgwind::solvers {

BoundedQuasiNewton::BoundedQuasiNewton()
    : BoundedQuasiNewton(Settings()) {}

BoundedQuasiNewton::BoundedQuasiNewton(const Settings& settings)
    : settings_(settings) {
    if (settings_.maxIterations < 0 || settings_.memorySize < 1 ||
        settings_.maxLineSearchSteps < 1 || !(settings_.pgtol >= 0) ||
        !(settings_.backtrack > 0 && settings_.backtrack < 1)) {
        throw ConfigurationError("Invalid bounded quasi-Newton settings");
    }
}

VectorX BoundedQuasiNewton::project(const VectorX& x, const VectorX& lower,
                                    const VectorX& upper) {
    return x.cwiseMax(lower).cwiseMin(upper);
}

Real BoundedQuasiNewton::projectedGradientNorm(const VectorX& x, const VectorX& g,
                                               const VectorX& lower, const VectorX& upper) {
    if (x.size() == 0) {
        return 0.0;
    }
    return (project(x - g, lower, upper) - x).cwiseAbs().maxCoeff();
}

VectorX BoundedQuasiNewton::evaluateGradient(const Gradient& grad, const VectorX& x) {
    VectorX g = grad(x);
    if (g.size() != x.size()) {
        throw std::runtime_error("Gradient length does not match the number of variables");
    }
    for (Index i = 0; i < g.size(); ++i) {
        if (!std::isfinite(g[i])) {
            g[i] = 0.0;
        }
    }
    return g;
}

VectorX BoundedQuasiNewton::searchDirection(const VectorX& g,
                                            const std::vector<bool>& free,
                                            const std::deque<VectorX>& sHistory,
                                            const std::deque<VectorX>& yHistory) const {
    const Index n = g.size();
    VectorX mask(n);
    for (Index i = 0; i < n; ++i) {
        mask[i] = free[static_cast<std::size_t>(i)] ? Real(1) : Real(0);
    }

    // L-BFGS two-loop recursion on the free subspace
    VectorX q = g.cwiseProduct(mask);
    const std::size_t m = sHistory.size();
    std::vector<Real> alpha(m, 0.0), rho(m, 0.0);

    for (std::size_t idx = m; idx-- > 0;) {
        VectorX s = sHistory[idx].cwiseProduct(mask);
        VectorX y = yHistory[idx].cwiseProduct(mask);
        Real sy = s.dot(y);
        if (sy <= SMALL) {
            continue;
        }
        rho[idx] = Real(1) / sy;
        alpha[idx] = rho[idx] * s.dot(q);
        q -= alpha[idx] * y;
    }

    // Initial Hessian scaling from the newest usable pair
    Real gamma = 1.0;
    for (std::size_t idx = m; idx-- > 0;) {
        if (rho[idx] > 0) {
            VectorX y = yHistory[idx].cwiseProduct(mask);
            gamma = Real(1) / (rho[idx] * y.squaredNorm());
            break;
        }
    }
    VectorX r = gamma * q;

    for (std::size_t idx = 0; idx < m; ++idx) {
        if (rho[idx] <= 0) {
            continue;
        }
        VectorX s = sHistory[idx].cwiseProduct(mask);
        VectorX y = yHistory[idx].cwiseProduct(mask);
        Real beta = rho[idx] * y.dot(r);
        r += s * (alpha[idx] - beta);
    }

    return -r.cwiseProduct(mask);
}

BoundedQuasiNewtonResult BoundedQuasiNewton::minimize(VectorX& x,
                                                      const Objective& f,
                                                      const Gradient& grad,
                                                      Real lower,
                                                      Real upper) const {
    return minimize(x, f, grad,
                    VectorX::Constant(x.size(), lower),
                    VectorX::Constant(x.size(), upper));
}

BoundedQuasiNewtonResult BoundedQuasiNewton::minimize(VectorX& x,
                                                      const Objective& f,
                                                      const Gradient& grad,
                                                      const VectorX& lower,
                                                      const VectorX& upper) const {
    const Index n = x.size();
    if (lower.size() != n || upper.size() != n) {
        throw ConfigurationError("Bounds do not match the number of variables");
    }
    for (Index i = 0; i < n; ++i) {
        if (!(lower[i] <= upper[i])) {
            throw ConfigurationError("Lower bound exceeds upper bound");
        }
    }

    BoundedQuasiNewtonResult result;

    // Start from a feasible point
    for (Index i = 0; i < n; ++i) {
        if (!std::isfinite(x[i])) {
            x[i] = std::max(lower[i], std::min(upper[i], Real(0)));
        }
    }
    x = project(x, lower, upper);

    Real fx = f(x);
    VectorX g = evaluateGradient(grad, x);
    result.evaluations = 1;

    if (!std::isfinite(fx)) {
        result.flag = TerminationFlag::ABNORMAL;
        result.value = fx;
        result.projectedGradientNorm = projectedGradientNorm(x, g, lower, upper);
        result.message = "Non-finite objective at the starting point";
        return result;
    }

    std::deque<VectorX> sHistory, yHistory;
    std::vector<bool> free(static_cast<std::size_t>(n), true);
    bool finished = false;

    while (!finished) {
        Real pgNorm = projectedGradientNorm(x, g, lower, upper);
        if (pgNorm <= settings_.pgtol) {
            result.flag = TerminationFlag::CONVERGED;
            result.message = "Projected gradient below tolerance";
            break;
        }
        if (result.iterations >= settings_.maxIterations) {
            result.flag = TerminationFlag::ITERATION_LIMIT;
            result.message = "Reached the iteration limit";
            break;
        }

        // Variables held at a bound by the gradient
        for (Index i = 0; i < n; ++i) {
            bool atLower = x[i] <= lower[i] && g[i] > 0;
            bool atUpper = x[i] >= upper[i] && g[i] < 0;
            free[static_cast<std::size_t>(i)] = !(atLower || atUpper);
        }

        VectorX d = searchDirection(g, free, sHistory, yHistory);
        bool steepest = sHistory.empty();
        if (!(d.dot(g) < 0)) {
            sHistory.clear();
            yHistory.clear();
            d = searchDirection(g, free, sHistory, yHistory);
            steepest = true;
        }

        // Projected backtracking line search
        bool accepted = false;
        VectorX xt;
        Real ft = fx;
        for (int attempt = 0; attempt < 2 && !accepted; ++attempt) {
            Real step = 1.0;
            if (steepest) {
                Real dmax = d.cwiseAbs().maxCoeff();
                step = dmax > Real(1) ? Real(1) / dmax : Real(1);
            }
            for (int ls = 0; ls < settings_.maxLineSearchSteps; ++ls) {
                xt = project(x + step * d, lower, upper);
                VectorX s = xt - x;
                if (s.cwiseAbs().maxCoeff() == Real(0)) {
                    break;
                }
                ft = f(xt);
                ++result.evaluations;
                if (std::isfinite(ft) && ft <= fx + settings_.armijo * g.dot(s)) {
                    accepted = true;
                    break;
                }
                step *= settings_.backtrack;
            }
            if (!accepted && !steepest) {
                // Retry once along the steepest descent direction
                sHistory.clear();
                yHistory.clear();
                d = searchDirection(g, free, sHistory, yHistory);
                steepest = true;
            } else {
                break;
            }
        }

        if (!accepted) {
            result.flag = TerminationFlag::ABNORMAL;
            result.message = "Line search failed to decrease the objective";
            finished = true;
            continue;
        }

        VectorX gt = evaluateGradient(grad, xt);
        VectorX s = xt - x;
        VectorX y = gt - g;
        if (s.dot(y) > EPSILON * y.squaredNorm()) {
            sHistory.push_back(s);
            yHistory.push_back(y);
            if (static_cast<int>(sHistory.size()) > settings_.memorySize) {
                sHistory.pop_front();
                yHistory.pop_front();
            }
        }

        x = xt;
        fx = ft;
        g = gt;
        ++result.iterations;
    }

    result.value = fx;
    result.projectedGradientNorm = projectedGradientNorm(x, g, lower, upper);
    MGWIND_LOG_DEBUG("Bounded quasi-Newton: flag {} after {} iterations ({} evaluations), "
                     "f = {:.6e}, |pg| = {:.3e}",
                     static_cast<int>(result.flag), result.iterations, result.evaluations,
                     result.value, result.projectedGradientNorm);
    return result;
}

} // namespace mgwind::solvers
