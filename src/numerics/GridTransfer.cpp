// === src/numerics/GridTransfer.cpp ===
#include "mgwind/numerics/GridTransfer.hpp"
#include "mgwind/numerics/Interpolation.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <cmath>

namespace mgwind::numerics {

GridTransfer::GridTransfer(const GridLevel& fine)
    : fine_(fine), coarse_(fine.coarsen()) {
}

GridTransfer::GridTransfer(GridLevel fine, GridLevel coarse)
    : fine_(std::move(fine)), coarse_(std::move(coarse)) {
}

VectorX GridTransfer::restrictValues(const VectorX& fineValues) const {
    return resample(fine_, fineValues, coarse_);
}

Field3D GridTransfer::restrictField(const Field3D& fineField) const {
    if (fineField.shape() != fine_.shape()) {
        throw ConfigurationError("Field shape does not match the fine grid level");
    }
    return Field3D::fromFilled(coarse_.shape(), restrictValues(fineField.filled(NaN)));
}

WindField GridTransfer::restrictWinds(const WindField& fineWinds) const {
    return WindField(coarse_.shape(),
                     WindField::stack(restrictValues(fineWinds.u()),
                                      restrictValues(fineWinds.v()),
                                      restrictValues(fineWinds.w())));
}

VectorX GridTransfer::prolongValues(const VectorX& coarseValues) const {
    return resample(coarse_, coarseValues, fine_);
}

WindField GridTransfer::prolongCorrection(const WindField& coarseSolution,
                                          const WindField& coarseInput) const {
    WindField correction(fine_.shape());
    for (WindComponent c : ALL_COMPONENTS) {
        VectorX delta = coarseSolution.component(c) - coarseInput.component(c);
        VectorX fineDelta = prolongValues(delta);
        for (Index i = 0; i < fineDelta.size(); ++i) {
            if (!std::isfinite(fineDelta[i])) {
                fineDelta[i] = Real(0);
            }
        }
        correction.component(c) = fineDelta;
    }
    return correction;
}

} // namespace mgwind::numerics
