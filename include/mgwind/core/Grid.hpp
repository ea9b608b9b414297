#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/GridLevel.hpp"
#include <map>
#include <string>
#include <vector>

namespace mgwind {

// Radar site metadata. Geographic position is informational; the retrieval
// uses the site position in the grid's projected coordinates.
struct RadarSite {
    std::string name;
    Real longitude = 0.0;
    Real latitude = 0.0;
    Real altitude = 0.0;
    Real x = 0.0;   // projected x of the site relative to the grid origin
    Real y = 0.0;   // projected y of the site relative to the grid origin
};

// Named field with its descriptive metadata
struct GridField {
    Field3D data;
    std::string standardName;
    std::string longName;
    std::string units;
    std::map<std::string, Real> attributes;

    GridField() = default;
    explicit GridField(Field3D field, std::string units_ = "")
        : data(std::move(field)), units(std::move(units_)) {}
};

// Gridded radar volume: coordinates, origin, site and named fields
class Grid {
public:
    Grid() = default;
    Grid(GridLevel level, RadarSite site);

    const GridLevel& level() const { return level_; }
    const Shape3& shape() const { return level_.shape(); }
    const VectorX& x() const { return level_.x(); }
    const VectorX& y() const { return level_.y(); }
    const VectorX& z() const { return level_.z(); }

    const RadarSite& site() const { return site_; }
    RadarSite& site() { return site_; }

    Real originLatitude() const { return originLatitude_; }
    Real originLongitude() const { return originLongitude_; }
    void setOrigin(Real latitude, Real longitude) {
        originLatitude_ = latitude;
        originLongitude_ = longitude;
    }

    // Field management
    bool hasField(const std::string& name) const { return fields_.count(name) > 0; }
    const GridField& field(const std::string& name) const;
    GridField& field(const std::string& name);
    void addField(const std::string& name, GridField field, bool replaceExisting = false);
    std::vector<std::string> fieldNames() const;

private:
    GridLevel level_;
    RadarSite site_;
    Real originLatitude_ = 0.0;
    Real originLongitude_ = 0.0;
    std::map<std::string, GridField> fields_;
};

} // namespace mgwind
