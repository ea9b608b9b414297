#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/GridLevel.hpp"
#include "mgwind/core/WindField.hpp"

namespace mgwind::numerics {

// Restriction and prolongation between a fine level and its coarse level,
// both by trilinear interpolation.
class GridTransfer {
public:
    explicit GridTransfer(const GridLevel& fine);
    GridTransfer(GridLevel fine, GridLevel coarse);

    const GridLevel& fine() const { return fine_; }
    const GridLevel& coarse() const { return coarse_; }

    // Fine -> coarse. Out-of-grid and NaN-touched results are NaN.
    VectorX restrictValues(const VectorX& fineValues) const;

    // Fine -> coarse for a masked field; NaN results are masked
    Field3D restrictField(const Field3D& fineField) const;

    // Fine -> coarse per wind component
    WindField restrictWinds(const WindField& fineWinds) const;

    // Coarse -> fine
    VectorX prolongValues(const VectorX& coarseValues) const;

    // Fine-level correction (solution - input) per component. Entries with
    // no defined interpolant are zero, so they leave the fine field as is.
    WindField prolongCorrection(const WindField& coarseSolution,
                                const WindField& coarseInput) const;

private:
    GridLevel fine_;
    GridLevel coarse_;
};

} // namespace mgwind::numerics
