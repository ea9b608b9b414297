#pragma once

#include "mgwind/core/Types.hpp"
#include <deque>
#include <functional>
#include <string>

namespace mgwind::solvers {

// Why the optimiser stopped
enum class TerminationFlag : int {
    CONVERGED = 0,          // projected gradient below tolerance
    ITERATION_LIMIT = 1,
    ABNORMAL = 2            // line search failure or non-finite objective
};

// Optimiser result
struct BoundedQuasiNewtonResult {
    TerminationFlag flag = TerminationFlag::ITERATION_LIMIT;
    int iterations = 0;
    int evaluations = 0;
    Real value = 0.0;
    Real projectedGradientNorm = 0.0;
    std::string message;

    bool converged() const { return flag == TerminationFlag::CONVERGED; }
};

// Limited-memory quasi-Newton minimiser with box constraints.
//
// The search direction is the L-BFGS two-loop recursion restricted to the
// free variables (those not held at a bound by the sign of the gradient).
// Steps follow the projected path P(x + alpha d) with Armijo backtracking.
class BoundedQuasiNewton {
public:
    struct Settings {
        int maxIterations = 200;
        Real pgtol = 1e-3;             // infinity norm of the projected gradient
        int memorySize = 10;
        int maxLineSearchSteps = 20;
        Real armijo = 1e-4;
        Real backtrack = 0.5;
    };

    using Objective = std::function<Real(const VectorX&)>;
    using Gradient = std::function<VectorX(const VectorX&)>;

    BoundedQuasiNewton();
    explicit BoundedQuasiNewton(const Settings& settings);

    // Minimise f over lower <= x <= upper, starting from and updating x.
    // Non-finite starting entries become the projection of zero.
    BoundedQuasiNewtonResult minimize(VectorX& x,
                                      const Objective& f,
                                      const Gradient& grad,
                                      const VectorX& lower,
                                      const VectorX& upper) const;

    // Same bound for every variable
    BoundedQuasiNewtonResult minimize(VectorX& x,
                                      const Objective& f,
                                      const Gradient& grad,
                                      Real lower,
                                      Real upper) const;

    const Settings& settings() const { return settings_; }

    // max_i |P(x - g)_i - x_i|
    static Real projectedGradientNorm(const VectorX& x, const VectorX& g,
                                      const VectorX& lower, const VectorX& upper);

private:
    Settings settings_;

    static VectorX project(const VectorX& x, const VectorX& lower, const VectorX& upper);

    // Gradient with non-finite entries set to zero
    static VectorX evaluateGradient(const Gradient& grad, const VectorX& x);

    // -H g over the free variables, zero elsewhere
    VectorX searchDirection(const VectorX& g,
                            const std::vector<bool>& free,
                            const std::deque<VectorX>& sHistory,
                            const std::deque<VectorX>& yHistory) const;
};

} // namespace mgwind::solvers
