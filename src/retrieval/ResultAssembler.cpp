// === src/retrieval/ResultAssembler.cpp ===
#include "mgwind/retrieval/ResultAssembler.hpp"
#include "mgwind/core/Exceptions.hpp"

namespace mgwind::retrieval {

VectorX combinedWeight(const physics::WeightSet& weights) {
    VectorX total = VectorX::Zero(weights.background.size());
    for (const VectorX& w : weights.observation) {
        total += w;
    }
    for (const VectorX& w : weights.model) {
        total += w;
    }
    return total;
}

GridField windComponentField(const GridField& templateField, const WindField& winds,
                             WindComponent component, const std::vector<bool>& mask,
                             const AssemblyOptions& options) {
    GridField field = templateField;
    field.data = winds.toField(component);
    field.data.maskWhere([&mask](Index p) { return mask[static_cast<std::size_t>(p)]; });

    switch (component) {
        case WindComponent::U:
            field.standardName = "u_wind";
            field.longName = "zonal component of wind velocity";
            break;
        case WindComponent::V:
            field.standardName = "v_wind";
            field.longName = "meridional component of wind velocity";
            break;
        case WindComponent::W:
            field.standardName = "w_wind";
            field.longName = "vertical component of wind velocity";
            break;
    }
    field.attributes["min_bca"] = options.minBca;
    field.attributes["max_bca"] = options.maxBca;
    return field;
}

std::vector<Grid> assembleResult(const std::vector<Grid>& grids,
                                 const WindField& winds,
                                 const physics::WeightSet& weights,
                                 const AssemblyOptions& options) {
    if (grids.empty()) {
        throw ConfigurationError("At least one grid is required");
    }
    const Index n = winds.componentSize();
    if (weights.background.size() != n) {
        throw ConfigurationError("Weights do not match the retrieved wind field");
    }

    const VectorX total = combinedWeight(weights);
    std::vector<bool> outside(static_cast<std::size_t>(n), false);
    for (Index p = 0; p < n; ++p) {
        outside[static_cast<std::size_t>(p)] = total[p] < Real(1);
    }
    const std::vector<bool> none(static_cast<std::size_t>(n), false);

    const std::vector<bool>& uvMask = options.maskOutsideOpt ? outside : none;
    const std::vector<bool>& wMask =
        (options.maskOutsideOpt || options.maskWOutsideOpt) ? outside : none;

    const GridField& templateField = grids.front().field(options.velocityField);
    GridField u = windComponentField(templateField, winds, WindComponent::U, uvMask, options);
    GridField v = windComponentField(templateField, winds, WindComponent::V, uvMask, options);
    GridField w = windComponentField(templateField, winds, WindComponent::W, wMask, options);

    std::vector<Grid> result;
    result.reserve(grids.size());
    for (const Grid& grid : grids) {
        Grid copy = grid;
        copy.addField(U_FIELD, u, true);
        copy.addField(V_FIELD, v, true);
        copy.addField(W_FIELD, w, true);
        result.push_back(std::move(copy));
    }
    return result;
}

} // namespace mgwind::retrieval
