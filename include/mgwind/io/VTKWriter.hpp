#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/GridLevel.hpp"
#include "mgwind/core/WindField.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace mgwind::io {

// Legacy VTK writer for rectilinear grids (ASCII, point data). Masked
// values are written as NaN.
class VTKWriter {
public:
    explicit VTKWriter(const GridLevel& level, std::string title = "mgwind output")
        : level_(level), title_(std::move(title)) {}

    // Fields to write; the writer keeps copies
    void addField(const std::string& name, const Field3D& field);
    void addVectorField(const std::string& name, const WindField& winds);

    // Every field of a grid
    void addGrid(const Grid& grid);

    void write(const std::string& filename) const;
    void write(std::ostream& os) const;

private:
    GridLevel level_;
    std::string title_;
    std::vector<std::pair<std::string, VectorX>> scalars_;
    std::vector<std::pair<std::string, WindField>> vectors_;

    static std::string sanitize(const std::string& name);
};

} // namespace mgwind::io
