// === src/numerics/Interpolation.cpp ===
#include "mgwind/numerics/Interpolation.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace mgwind::numerics {

namespace {

// Queries this close to an end node count as on the node
Real axisTolerance(const VectorX& axis) {
    Real span = axis.size() > 1 ? std::abs(axis[axis.size() - 1] - axis[0]) : Real(1);
    return Real(1e-9) * std::max(Real(1), span);
}

} // namespace

TrilinearInterpolator::TrilinearInterpolator(const GridLevel& level, const VectorX& values)
    : level_(level), values_(values) {
    if (values_.size() != level_.size()) {
        throw ConfigurationError("Interpolated values do not match the grid level size");
    }
}

TrilinearInterpolator::Bracket TrilinearInterpolator::locate(const VectorX& axis, Real q) {
    Bracket b;
    const Index n = axis.size();
    if (n == 0 || !std::isfinite(q)) {
        return b;
    }

    const Real tol = axisTolerance(axis);
    if (n == 1) {
        b.inside = std::abs(q - axis[0]) <= tol;
        return b;
    }

    if (q < axis[0] - tol || q > axis[n - 1] + tol) {
        return b;
    }

    q = std::clamp(q, axis[0], axis[n - 1]);
    const Real* begin = axis.data();
    const Real* end = axis.data() + n;
    Index upper = std::upper_bound(begin, end, q) - begin;
    Index lower = std::clamp<Index>(upper - 1, 0, n - 2);

    b.lower = lower;
    b.t = (q - axis[lower]) / (axis[lower + 1] - axis[lower]);
    b.inside = true;
    return b;
}

Real TrilinearInterpolator::blend(const Bracket& bz, const Bracket& by,
                                  const Bracket& bx) const {
    if (!bz.inside || !by.inside || !bx.inside) {
        return NaN;
    }

    const Shape3& s = level_.shape();
    const std::array<Real, 2> wz = {Real(1) - bz.t, bz.t};
    const std::array<Real, 2> wy = {Real(1) - by.t, by.t};
    const std::array<Real, 2> wx = {Real(1) - bx.t, bx.t};

    Real value = 0.0;
    for (int dk = 0; dk < 2; ++dk) {
        for (int dj = 0; dj < 2; ++dj) {
            for (int di = 0; di < 2; ++di) {
                Real weight = wz[dk] * wy[dj] * wx[di];
                if (weight == Real(0)) {
                    continue;
                }
                Real corner = values_[s.index(bz.lower + dk, by.lower + dj, bx.lower + di)];
                if (!std::isfinite(corner)) {
                    return NaN;
                }
                value += weight * corner;
            }
        }
    }
    return value;
}

Real TrilinearInterpolator::operator()(Real z, Real y, Real x) const {
    return blend(locate(level_.z(), z), locate(level_.y(), y), locate(level_.x(), x));
}

VectorX TrilinearInterpolator::sample(const GridLevel& target) const {
    // Brackets are separable, so locate each target axis once
    auto bracketAxis = [](const VectorX& source, const VectorX& queries) {
        std::vector<Bracket> brackets(static_cast<std::size_t>(queries.size()));
        for (Index i = 0; i < queries.size(); ++i) {
            brackets[static_cast<std::size_t>(i)] = locate(source, queries[i]);
        }
        return brackets;
    };

    const auto bz = bracketAxis(level_.z(), target.z());
    const auto by = bracketAxis(level_.y(), target.y());
    const auto bx = bracketAxis(level_.x(), target.x());

    const Shape3& t = target.shape();
    VectorX result(t.size());
    for (Index k = 0; k < t.nz; ++k) {
        for (Index j = 0; j < t.ny; ++j) {
            for (Index i = 0; i < t.nx; ++i) {
                result[t.index(k, j, i)] = blend(bz[static_cast<std::size_t>(k)],
                                                 by[static_cast<std::size_t>(j)],
                                                 bx[static_cast<std::size_t>(i)]);
            }
        }
    }
    return result;
}

VectorX resample(const GridLevel& source, const VectorX& values, const GridLevel& target) {
    return TrilinearInterpolator(source, values).sample(target);
}

VectorX interpolateProfile(const VectorX& heights, const VectorX& values,
                           const VectorX& targets) {
    if (heights.size() != values.size()) {
        throw ConfigurationError("Profile heights and values differ in length");
    }

    VectorX result(targets.size());
    for (Index i = 0; i < targets.size(); ++i) {
        auto b = TrilinearInterpolator::locate(heights, targets[i]);
        if (!b.inside) {
            result[i] = NaN;
        } else if (heights.size() == 1) {
            result[i] = values[0];
        } else {
            result[i] = (Real(1) - b.t) * values[b.lower] + b.t * values[b.lower + 1];
        }
    }
    return result;
}

} // namespace mgwind::numerics
