#pragma once

#include "mgwind/core/Types.hpp"
#include <functional>
#include <string>

namespace mgwind {

// Masked 3D scalar field on one grid level.
//
// Values live in a flat Eigen vector in (z, y, x) order next to a validity
// mask. A masked cell holds no observation; its stored value is meaningless
// and `filled()` replaces it.
class Field3D {
public:
    Field3D() = default;
    explicit Field3D(const Shape3& shape, Real initialValue = Real(0));
    Field3D(const Shape3& shape, VectorX values);

    // Build from raw values, masking every non-finite entry
    static Field3D fromFilled(const Shape3& shape, const VectorX& values);

    // Field information
    const Shape3& shape() const { return shape_; }
    Index size() const { return shape_.size(); }

    // Data access
    Real& operator[](Index i) { return data_[i]; }
    const Real& operator[](Index i) const { return data_[i]; }

    Real& operator()(Index k, Index j, Index i) { return data_[shape_.index(k, j, i)]; }
    const Real& operator()(Index k, Index j, Index i) const {
        return data_[shape_.index(k, j, i)];
    }

    const VectorX& data() const { return data_; }
    VectorX& data() { return data_; }

    // Mask handling
    bool isValid(Index i) const { return !masked_[static_cast<std::size_t>(i)]; }
    bool isMasked(Index i) const { return masked_[static_cast<std::size_t>(i)]; }
    void setMasked(Index i, bool masked) { masked_[static_cast<std::size_t>(i)] = masked; }
    void maskWhere(const std::function<bool(Index)>& predicate);
    void maskNonFinite();
    Index countValid() const;

    // Values with masked cells replaced by `fillValue`
    VectorX filled(Real fillValue = NaN) const;

    // 1 where valid, 0 where masked
    VectorX validity() const;

    void initialize(Real value);

private:
    Shape3 shape_;
    VectorX data_;
    std::vector<bool> masked_;
};

} // namespace mgwind
