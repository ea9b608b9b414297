// === src/core/Grid.cpp ===
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/Exceptions.hpp"

namespace mgwind {

Grid::Grid(GridLevel level, RadarSite site)
    : level_(std::move(level)), site_(std::move(site)) {
}

const GridField& Grid::field(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        throw ConfigurationError("Grid has no field named '" + name + "'");
    }
    return it->second;
}

GridField& Grid::field(const std::string& name) {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        throw ConfigurationError("Grid has no field named '" + name + "'");
    }
    return it->second;
}

void Grid::addField(const std::string& name, GridField field, bool replaceExisting) {
    if (field.data.shape() != shape()) {
        throw ConfigurationError("Field '" + name + "' does not match the grid shape");
    }
    if (!replaceExisting && hasField(name)) {
        throw ConfigurationError("Field '" + name + "' already exists on the grid");
    }
    fields_[name] = std::move(field);
}

std::vector<std::string> Grid::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& entry : fields_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace mgwind
