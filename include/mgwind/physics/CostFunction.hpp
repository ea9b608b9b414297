#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include "mgwind/numerics/FiniteDifference.hpp"
#include <optional>

namespace mgwind::physics {

// Regularisation coefficients of the variational problem. Immutable for the
// whole retrieval.
struct CostParameters {
    Real observation = 1.0;        // radial velocity fit
    Real massContinuity = 1500.0;  // anelastic mass continuity
    Real smoothnessX = 0.0;
    Real smoothnessY = 0.0;
    Real smoothnessZ = 0.0;
    Real background = 0.0;         // sounding background constraint
    Real vorticity = 0.0;          // steady vertical vorticity equation
    Real model = 0.0;              // blending with model winds

    // Storm motion, required by the vorticity constraint
    std::optional<Real> stormU;
    std::optional<Real> stormV;

    bool upperBoundary = true;     // w gradient is zero on the top level
    bool anelastic = true;

    // Throws ConfigurationError for inconsistent coefficients
    void validate(bool haveModelFields) const;
};

// Value of each term of the cost function
struct CostBreakdown {
    Real observation = 0.0;
    Real massContinuity = 0.0;
    Real smoothness = 0.0;
    Real background = 0.0;
    Real vorticity = 0.0;
    Real model = 0.0;

    Real total() const {
        return observation + massContinuity + smoothness + background + vorticity + model;
    }
};

// Cost function J(winds) and its gradient on one analysis level. `winds` is
// the flattened [u, v, w] vector of that level.
class CostFunction {
public:
    virtual ~CostFunction() = default;

    virtual Real value(const VectorX& winds, const AnalysisLevel& level,
                       const CostParameters& params) const = 0;

    virtual VectorX gradient(const VectorX& winds, const AnalysisLevel& level,
                             const CostParameters& params) const = 0;
};

// Reference variational cost function: observation, mass continuity,
// smoothness, background, vorticity and model terms, with gradients that are
// exact adjoints of the discrete operators.
class VariationalCostFunction : public CostFunction {
public:
    Real value(const VectorX& winds, const AnalysisLevel& level,
               const CostParameters& params) const override;

    VectorX gradient(const VectorX& winds, const AnalysisLevel& level,
                     const CostParameters& params) const override;

    CostBreakdown evaluateTerms(const VectorX& winds, const AnalysisLevel& level,
                                const CostParameters& params) const;

private:
    struct Components;

    Real observationCost(const Components& c, const AnalysisLevel& level,
                         const CostParameters& params) const;
    void observationGradient(const Components& c, const AnalysisLevel& level,
                             const CostParameters& params, VectorX& grad) const;

    Real massContinuityCost(const Components& c, const AnalysisLevel& level,
                            const CostParameters& params) const;
    void massContinuityGradient(const Components& c, const AnalysisLevel& level,
                                const CostParameters& params, VectorX& grad) const;

    Real smoothnessCost(const Components& c, const AnalysisLevel& level,
                        const CostParameters& params) const;
    void smoothnessGradient(const Components& c, const AnalysisLevel& level,
                            const CostParameters& params, VectorX& grad) const;

    Real backgroundCost(const Components& c, const AnalysisLevel& level,
                        const CostParameters& params) const;
    void backgroundGradient(const Components& c, const AnalysisLevel& level,
                            const CostParameters& params, VectorX& grad) const;

    Real vorticityCost(const Components& c, const AnalysisLevel& level,
                       const CostParameters& params) const;
    void vorticityGradient(const Components& c, const AnalysisLevel& level,
                           const CostParameters& params, VectorX& grad) const;

    Real modelCost(const Components& c, const AnalysisLevel& level,
                   const CostParameters& params) const;
    void modelGradient(const Components& c, const AnalysisLevel& level,
                       const CostParameters& params, VectorX& grad) const;

    static numerics::FiniteDifference differences(const AnalysisLevel& level);
    static VectorX anelasticCoefficients(const AnalysisLevel& level,
                                         const numerics::FiniteDifference& fd);
};

} // namespace mgwind::physics
