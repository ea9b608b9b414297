// === src/numerics/FiniteDifference.cpp ===
#include "mgwind/numerics/FiniteDifference.hpp"
#include "mgwind/core/Exceptions.hpp"

namespace mgwind::numerics {

FiniteDifference::FiniteDifference(const Shape3& shape, Real dz, Real dy, Real dx)
    : shape_(shape), spacing_{dz, dy, dx} {
    for (Axis a : {Axis::Z, Axis::Y, Axis::X}) {
        if (length(a) > 1 && !(spacing_[static_cast<int>(a)] > Real(0))) {
            throw ConfigurationError("Grid spacing must be positive along every axis");
        }
    }
}

Index FiniteDifference::stride(Axis axis) const {
    switch (axis) {
        case Axis::Z: return shape_.planeSize();
        case Axis::Y: return shape_.nx;
        case Axis::X: return 1;
    }
    return 1;
}

Index FiniteDifference::length(Axis axis) const {
    switch (axis) {
        case Axis::Z: return shape_.nz;
        case Axis::Y: return shape_.ny;
        case Axis::X: return shape_.nx;
    }
    return 1;
}

VectorX FiniteDifference::first(const VectorX& f, Axis axis) const {
    const Index n = length(axis);
    const Index s = stride(axis);
    VectorX out = VectorX::Zero(shape_.size());
    if (n < 2) {
        return out;
    }

    const Real h = spacing_[static_cast<int>(axis)];
    for (Index p = 0; p < shape_.size(); ++p) {
        const Index c = (p / s) % n;
        if (c == 0) {
            out[p] = (f[p + s] - f[p]) / h;
        } else if (c == n - 1) {
            out[p] = (f[p] - f[p - s]) / h;
        } else {
            out[p] = (f[p + s] - f[p - s]) / (Real(2) * h);
        }
    }
    return out;
}

VectorX FiniteDifference::firstAdjoint(const VectorX& r, Axis axis) const {
    const Index n = length(axis);
    const Index s = stride(axis);
    VectorX out = VectorX::Zero(shape_.size());
    if (n < 2) {
        return out;
    }

    const Real h = spacing_[static_cast<int>(axis)];
    for (Index p = 0; p < shape_.size(); ++p) {
        const Index c = (p / s) % n;
        const Real rp = r[p];
        if (c == 0) {
            out[p + s] += rp / h;
            out[p] -= rp / h;
        } else if (c == n - 1) {
            out[p] += rp / h;
            out[p - s] -= rp / h;
        } else {
            out[p + s] += rp / (Real(2) * h);
            out[p - s] -= rp / (Real(2) * h);
        }
    }
    return out;
}

VectorX FiniteDifference::second(const VectorX& f, Axis axis) const {
    const Index n = length(axis);
    const Index s = stride(axis);
    VectorX out = VectorX::Zero(shape_.size());
    if (n < 3) {
        return out;
    }

    const Real h2 = sqr(spacing_[static_cast<int>(axis)]);
    for (Index p = 0; p < shape_.size(); ++p) {
        const Index c = (p / s) % n;
        if (c > 0 && c < n - 1) {
            out[p] = (f[p + s] - Real(2) * f[p] + f[p - s]) / h2;
        }
    }
    return out;
}

VectorX FiniteDifference::secondAdjoint(const VectorX& r, Axis axis) const {
    const Index n = length(axis);
    const Index s = stride(axis);
    VectorX out = VectorX::Zero(shape_.size());
    if (n < 3) {
        return out;
    }

    const Real h2 = sqr(spacing_[static_cast<int>(axis)]);
    for (Index p = 0; p < shape_.size(); ++p) {
        const Index c = (p / s) % n;
        if (c > 0 && c < n - 1) {
            const Real rp = r[p] / h2;
            out[p + s] += rp;
            out[p] -= Real(2) * rp;
            out[p - s] += rp;
        }
    }
    return out;
}

} // namespace mgwind::numerics
