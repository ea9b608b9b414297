#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/io/Logger.hpp"
#include "mgwind/io/SyntheticCase.hpp"
#include "mgwind/retrieval/WindRetrieval.hpp"
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include <json/json.h>

namespace mgwind::io {

// One radar of a case. Without field files its observations are synthesised
// from the case's analytic flow.
struct RadarCase {
    RadarSite site;
    std::string velocityFile;       // raw float64, (z, y, x), NaN = missing
    std::string reflectivityFile;
};

struct LoggingSettings {
    Logger::Level level = Logger::Level::INFO;
    std::string file;               // empty: console only
};

// Everything a retrieval run needs besides the settings
struct CaseDescription {
    std::string name = "case";
    GridLevel level;
    Real originLatitude = 0.0;
    Real originLongitude = 0.0;
    std::vector<RadarCase> radars;
    std::optional<SyntheticFlow> synthetic;
    std::optional<retrieval::Sounding> sounding;
    Real initialU = 0.0;
    Real initialV = 0.0;
    Real initialW = 0.0;
    std::string vtkOutput;          // empty: no VTK output
};

struct CaseConfig {
    retrieval::RetrievalSettings settings;
    CaseDescription description;
    LoggingSettings logging;
};

// Reader for YAML (.yaml, .yml) and JSON (.json) case files. Relative field
// file paths resolve against the case file's directory.
class CaseReader {
public:
    explicit CaseReader(const std::string& filename);

    CaseConfig read() const;

    retrieval::RetrievalSettings readSettings() const;
    CaseDescription readCase() const;
    LoggingSettings readLogging() const;

    // Grids of every radar: from field files, or synthesised
    std::vector<Grid> loadGrids(const CaseDescription& description,
                                const retrieval::RetrievalSettings& settings) const;

    // Raw float64 fields in (z, y, x) order; non-finite values are masked
    static Field3D readRawField(const std::string& path, const Shape3& shape);
    static void writeRawField(const std::string& path, const Field3D& field);

    // JSON tree as the equivalent YAML tree
    static YAML::Node toYaml(const Json::Value& value);

private:
    std::string filename_;
    std::string baseDir_;
    YAML::Node config_;

    std::string resolvePath(const std::string& path) const;

    static VectorX parseAxis(const YAML::Node& node, const std::string& name);
    static VectorX parseVector(const YAML::Node& node, const std::string& name);
};

} // namespace mgwind::io
