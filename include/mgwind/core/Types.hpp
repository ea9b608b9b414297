#pragma once

#include <Eigen/Core>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace mgwind {

// Precision configuration
#ifdef MGWIND_DOUBLE_PRECISION
using Real = double;
#else
using Real = float;
#endif

// Integer types
using Index = std::int64_t;

// Mathematical constants
inline constexpr Real PI = Real(3.14159265358979323846);
inline constexpr Real DEG_TO_RAD = PI / Real(180);
inline constexpr Real RAD_TO_DEG = Real(180) / PI;
inline constexpr Real EPSILON = std::numeric_limits<Real>::epsilon();
inline constexpr Real SMALL = Real(1e-20);
inline constexpr Real NaN = std::numeric_limits<Real>::quiet_NaN();

// Vector types
using VectorX = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

// Extent of a 3D array stored in (z, y, x) C order
struct Shape3 {
    Index nz = 0;
    Index ny = 0;
    Index nx = 0;

    Shape3() = default;
    Shape3(Index z, Index y, Index x) : nz(z), ny(y), nx(x) {}

    Index size() const { return nz * ny * nx; }
    Index planeSize() const { return ny * nx; }

    Index index(Index k, Index j, Index i) const {
        return (k * ny + j) * nx + i;
    }

    bool operator==(const Shape3& other) const {
        return nz == other.nz && ny == other.ny && nx == other.nx;
    }
    bool operator!=(const Shape3& other) const { return !(*this == other); }
};

// Wind components in the order they are stored in a WindField
enum class WindComponent : int {
    U = 0,
    V = 1,
    W = 2
};

inline constexpr std::array<WindComponent, 3> ALL_COMPONENTS = {
    WindComponent::U, WindComponent::V, WindComponent::W};

// Grid axes, named after the array dimension they index
enum class Axis : int {
    Z = 0,
    Y = 1,
    X = 2
};

// Utility functions
template<typename T>
inline T sqr(T x) { return x * x; }

} // namespace mgwind
