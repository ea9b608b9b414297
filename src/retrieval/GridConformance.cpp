// === src/retrieval/GridConformance.cpp ===
#include "mgwind/retrieval/GridConformance.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <cmath>
#include <string>

namespace mgwind::retrieval {

namespace {

bool axesMatch(const VectorX& a, const VectorX& b, Real tolerance) {
    if (a.size() != b.size()) {
        return false;
    }
    for (Index i = 0; i < a.size(); ++i) {
        if (!(std::abs(a[i] - b[i]) <= tolerance)) {
            return false;
        }
    }
    return true;
}

} // namespace

void checkGridConformance(const std::vector<Grid>& grids, Real tolerance) {
    if (grids.empty()) {
        throw ConfigurationError("At least one grid is required");
    }
    if (!grids.front().level().canCoarsen()) {
        throw ConfigurationError(
            "Grid axes must be strictly increasing with at least 2 nodes along x, y and z");
    }

    const char* names[3] = {"z", "y", "x"};
    for (std::size_t g = 1; g < grids.size(); ++g) {
        const Grid& prev = grids[g - 1];
        const Grid& cur = grids[g];
        const std::string pair = "Grids " + std::to_string(g - 1) + " and " + std::to_string(g);

        for (Axis a : {Axis::X, Axis::Y, Axis::Z}) {
            if (!axesMatch(prev.level().axis(a), cur.level().axis(a), tolerance)) {
                throw ConfigurationError(pair + " do not have equal " +
                                         names[static_cast<int>(a)] + " coordinates");
            }
        }
        if (prev.originLatitude() != cur.originLatitude()) {
            throw ConfigurationError(pair + " have unequal origin latitudes");
        }
    }

    MGWIND_LOG_DEBUG("{} grid(s) share one coordinate system", grids.size());
}

} // namespace mgwind::retrieval
