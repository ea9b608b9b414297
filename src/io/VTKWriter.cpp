// === src/io/VTKWriter.cpp ===
#include "mgwind/io/VTKWriter.hpp"
#include "mgwind/io/Logger.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <fstream>
#include <iomanip>

namespace mgwind::io {

void VTKWriter::addField(const std::string& name, const Field3D& field) {
    if (field.shape() != level_.shape()) {
        throw ConfigurationError("Field '" + name + "' does not match the output grid");
    }
    scalars_.emplace_back(sanitize(name), field.filled(NaN));
}

void VTKWriter::addVectorField(const std::string& name, const WindField& winds) {
    if (winds.shape() != level_.shape()) {
        throw ConfigurationError("Vector field '" + name + "' does not match the output grid");
    }
    vectors_.emplace_back(sanitize(name), winds);
}

void VTKWriter::addGrid(const Grid& grid) {
    for (const std::string& name : grid.fieldNames()) {
        addField(name, grid.field(name).data);
    }
}

void VTKWriter::write(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    write(file);
    if (!file) {
        throw std::runtime_error("Failed writing VTK file: " + filename);
    }
    MGWIND_LOG_DEBUG("Wrote VTK file: {}", filename);
}

void VTKWriter::write(std::ostream& os) const {
    const Shape3& s = level_.shape();

    // Header
    os << "# vtk DataFile Version 3.0\n";
    os << title_ << "\n";
    os << "ASCII\n";
    os << "DATASET RECTILINEAR_GRID\n";
    os << "DIMENSIONS " << s.nx << " " << s.ny << " " << s.nz << "\n";

    // Coordinates
    os << std::scientific << std::setprecision(6);
    auto writeAxis = [&os](const char* label, const VectorX& axis) {
        os << label << " " << axis.size() << " double\n";
        for (Index i = 0; i < axis.size(); ++i) {
            os << axis[i] << (i + 1 < axis.size() ? " " : "\n");
        }
    };
    writeAxis("X_COORDINATES", level_.x());
    writeAxis("Y_COORDINATES", level_.y());
    writeAxis("Z_COORDINATES", level_.z());

    if (scalars_.empty() && vectors_.empty()) {
        return;
    }

    // Point data, x varying fastest as in (z, y, x) order
    os << "\nPOINT_DATA " << s.size() << "\n";
    for (const auto& [name, values] : scalars_) {
        os << "SCALARS " << name << " double 1\n";
        os << "LOOKUP_TABLE default\n";
        for (Index p = 0; p < values.size(); ++p) {
            os << values[p] << "\n";
        }
    }
    for (const auto& [name, winds] : vectors_) {
        os << "VECTORS " << name << " double\n";
        auto u = winds.u();
        auto v = winds.v();
        auto w = winds.w();
        for (Index p = 0; p < s.size(); ++p) {
            os << u[p] << " " << v[p] << " " << w[p] << "\n";
        }
    }
}

std::string VTKWriter::sanitize(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        if (c == ' ' || c == '\t') {
            c = '_';
        }
    }
    return out;
}

} // namespace mgwind::io
