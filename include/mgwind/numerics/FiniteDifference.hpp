#pragma once

#include "mgwind/core/Types.hpp"

namespace mgwind::numerics {

// Finite difference operators on a uniformly spaced (z, y, x) array and their
// exact adjoints (transposes), as needed by variational cost gradients.
//
// First derivative: second-order central differences in the interior and
// first-order one-sided differences on the two end nodes; zero along an axis
// with a single node.
// Second derivative: three-point stencil at interior nodes, zero on the end
// nodes and along axes shorter than three nodes.
class FiniteDifference {
public:
    FiniteDifference(const Shape3& shape, Real dz, Real dy, Real dx);

    const Shape3& shape() const { return shape_; }

    VectorX first(const VectorX& f, Axis axis) const;
    VectorX firstAdjoint(const VectorX& r, Axis axis) const;

    VectorX second(const VectorX& f, Axis axis) const;
    VectorX secondAdjoint(const VectorX& r, Axis axis) const;

    // Shorthands
    VectorX ddx(const VectorX& f) const { return first(f, Axis::X); }
    VectorX ddy(const VectorX& f) const { return first(f, Axis::Y); }
    VectorX ddz(const VectorX& f) const { return first(f, Axis::Z); }
    VectorX ddxT(const VectorX& r) const { return firstAdjoint(r, Axis::X); }
    VectorX ddyT(const VectorX& r) const { return firstAdjoint(r, Axis::Y); }
    VectorX ddzT(const VectorX& r) const { return firstAdjoint(r, Axis::Z); }

private:
    Shape3 shape_;
    std::array<Real, 3> spacing_;   // indexed by Axis

    Index stride(Axis axis) const;
    Index length(Axis axis) const;
};

} // namespace mgwind::numerics
