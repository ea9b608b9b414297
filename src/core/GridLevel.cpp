// === src/core/GridLevel.cpp ===
#include "mgwind/core/GridLevel.hpp"
#include "mgwind/core/Exceptions.hpp"

namespace mgwind {

namespace {

bool strictlyIncreasing(const VectorX& axis) {
    for (Index i = 1; i < axis.size(); ++i) {
        if (!(axis[i] > axis[i - 1])) {
            return false;
        }
    }
    return true;
}

} // namespace

GridLevel::GridLevel(VectorX z, VectorX y, VectorX x)
    : z_(std::move(z)), y_(std::move(y)), x_(std::move(x)),
      shape_(z_.size(), y_.size(), x_.size()) {
}

const VectorX& GridLevel::axis(Axis a) const {
    switch (a) {
        case Axis::Z: return z_;
        case Axis::Y: return y_;
        case Axis::X: return x_;
    }
    return x_;
}

GridLevel GridLevel::coarsen() const {
    if (!canCoarsen()) {
        throw ConfigurationError(
            "Grid axes must be strictly increasing with at least 2 nodes to build a coarse level");
    }
    return GridLevel(coarsenAxis(z_), coarsenAxis(y_), coarsenAxis(x_));
}

VectorX GridLevel::coarsenAxis(const VectorX& fine) {
    const Index n = fine.size() / 2;
    VectorX coarse(n);
    for (Index i = 0; i < n; ++i) {
        coarse[i] = (fine[2 * i] + fine[2 * i + 1]) / Real(2);
    }
    return coarse;
}

VectorX GridLevel::pointZ() const {
    VectorX heights(size());
    for (Index k = 0; k < shape_.nz; ++k) {
        heights.segment(k * shape_.planeSize(), shape_.planeSize()).setConstant(z_[k]);
    }
    return heights;
}

bool GridLevel::canCoarsen() const {
    return z_.size() >= 2 && y_.size() >= 2 && x_.size() >= 2 &&
           strictlyIncreasing(z_) && strictlyIncreasing(y_) && strictlyIncreasing(x_);
}

} // namespace mgwind
