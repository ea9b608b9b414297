#pragma once

#include "mgwind/core/Types.hpp"

namespace mgwind {

// Coordinate axes of one resolution level of a rectilinear grid.
//
// Axes are strictly increasing 1D coordinate arrays in a shared projected
// system. The 3D mesh is implicit: node (k, j, i) sits at (z[k], y[j], x[i]).
class GridLevel {
public:
    GridLevel() = default;
    GridLevel(VectorX z, VectorX y, VectorX x);

    // Level with half the node count per axis, each node at the midpoint of
    // two adjacent fine nodes
    GridLevel coarsen() const;

    const VectorX& z() const { return z_; }
    const VectorX& y() const { return y_; }
    const VectorX& x() const { return x_; }
    const VectorX& axis(Axis a) const;

    const Shape3& shape() const { return shape_; }
    Index size() const { return shape_.size(); }

    // Spacing between the first two nodes of each axis (0 for a single node)
    Real dz() const { return spacing(z_); }
    Real dy() const { return spacing(y_); }
    Real dx() const { return spacing(x_); }

    // Height of every node, in (z, y, x) order
    VectorX pointZ() const;

    // True if the axes are strictly increasing and long enough to coarsen
    bool canCoarsen() const;

    // Midpoint averages of adjacent pairs: c[i] = (f[2i] + f[2i+1]) / 2
    static VectorX coarsenAxis(const VectorX& fine);

private:
    VectorX z_, y_, x_;
    Shape3 shape_;

    static Real spacing(const VectorX& axis) {
        return axis.size() > 1 ? axis[1] - axis[0] : Real(0);
    }
};

} // namespace mgwind
