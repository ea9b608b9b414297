// === src/io/CaseReader.cpp ===
#include "mgwind/io/CaseReader.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>

namespace mgwind::io {

namespace fs = std::filesystem;

namespace {

std::string extensionOf(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

template<typename T>
void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) {
        target = node[key].as<T>();
    }
}

void readOptional(const YAML::Node& node, const char* key, std::optional<Real>& target) {
    if (node && node[key] && !node[key].IsNull()) {
        target = node[key].as<Real>();
    }
}

} // namespace

CaseReader::CaseReader(const std::string& filename)
    : filename_(filename) {
    if (!fs::exists(filename_)) {
        throw ConfigurationError("Case file does not exist: " + filename_);
    }
    baseDir_ = fs::path(filename_).parent_path().string();

    const std::string ext = extensionOf(filename_);
    try {
        if (ext == ".yaml" || ext == ".yml") {
            config_ = YAML::LoadFile(filename_);
        } else if (ext == ".json") {
            std::ifstream file(filename_);
            if (!file) {
                throw ConfigurationError("Cannot open case file: " + filename_);
            }
            Json::CharReaderBuilder builder;
            Json::Value root;
            std::string errors;
            if (!Json::parseFromStream(builder, file, &root, &errors)) {
                throw ConfigurationError("Malformed JSON case file " + filename_ + ": " + errors);
            }
            config_ = toYaml(root);
        } else {
            throw ConfigurationError("Unsupported case file format: " + ext);
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Malformed YAML case file " + filename_ + ": " + ex.what());
    }

    if (!config_.IsMap()) {
        throw ConfigurationError("Case file must hold a mapping at the top level: " + filename_);
    }
    MGWIND_LOG_INFO("Loaded configuration from: {}", filename_);
}

YAML::Node CaseReader::toYaml(const Json::Value& value) {
    switch (value.type()) {
        case Json::objectValue: {
            YAML::Node node(YAML::NodeType::Map);
            for (const std::string& name : value.getMemberNames()) {
                node[name] = toYaml(value[name]);
            }
            return node;
        }
        case Json::arrayValue: {
            YAML::Node node(YAML::NodeType::Sequence);
            for (const Json::Value& item : value) {
                node.push_back(toYaml(item));
            }
            return node;
        }
        case Json::stringValue:
            return YAML::Node(value.asString());
        case Json::booleanValue:
            return YAML::Node(value.asBool());
        case Json::intValue:
            return YAML::Node(static_cast<long long>(value.asInt64()));
        case Json::uintValue:
            return YAML::Node(static_cast<unsigned long long>(value.asUInt64()));
        case Json::realValue:
            return YAML::Node(value.asDouble());
        case Json::nullValue:
            break;
    }
    return YAML::Node(YAML::NodeType::Null);
}

CaseConfig CaseReader::read() const {
    CaseConfig config;
    config.settings = readSettings();
    config.description = readCase();
    config.logging = readLogging();
    return config;
}

retrieval::RetrievalSettings CaseReader::readSettings() const {
    retrieval::RetrievalSettings settings;
    try {
        // Cost function coefficients
        const YAML::Node cost = config_["cost"];
        physics::CostParameters& c = settings.cost;
        readValue(cost, "observation", c.observation);
        readValue(cost, "massContinuity", c.massContinuity);
        readValue(cost, "smoothnessX", c.smoothnessX);
        readValue(cost, "smoothnessY", c.smoothnessY);
        readValue(cost, "smoothnessZ", c.smoothnessZ);
        readValue(cost, "background", c.background);
        readValue(cost, "vorticity", c.vorticity);
        readValue(cost, "model", c.model);
        readOptional(cost, "stormU", c.stormU);
        readOptional(cost, "stormV", c.stormV);
        readValue(cost, "upperBoundary", c.upperBoundary);
        readValue(cost, "anelastic", c.anelastic);

        // Multigrid tuning
        const YAML::Node solver = config_["solver"];
        solvers::MultigridSettings& m = settings.multigrid;
        readValue(solver, "relaxationSteps", m.relaxationSteps);
        readValue(solver, "relaxationStep", m.relaxationStep);
        readValue(solver, "residualScale", m.residualScale);
        readValue(solver, "windBound", m.windBound);
        readValue(solver, "coarseMaxIterations", m.coarseMaxIterations);
        readValue(solver, "coarsePgtol", m.coarsePgtol);
        readValue(solver, "coarseMemory", m.coarseMemory);
        readValue(solver, "iterationIncrement", m.iterationIncrement);
        readValue(solver, "maxIterations", m.maxIterations);
        readValue(solver, "diagnosticInterval", m.diagnosticInterval);
        readValue(solver, "outputCostFunctions", m.outputCostFunctions);

        // Retrieval options
        const YAML::Node retrieval = config_["retrieval"];
        readValue(retrieval, "minBca", settings.minBca);
        readValue(retrieval, "maxBca", settings.maxBca);
        readValue(retrieval, "maskOutsideOpt", settings.maskOutsideOpt);
        readValue(retrieval, "maskWOutsideOpt", settings.maskWOutsideOpt);
        readValue(retrieval, "velocityField", settings.velocityField);
        readValue(retrieval, "reflectivityField", settings.reflectivityField);
        readValue(retrieval, "freezingLevel", settings.freezingLevel);
        readValue(retrieval, "axisTolerance", settings.axisTolerance);
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Invalid settings in " + filename_ + ": " + ex.what());
    }
    return settings;
}

LoggingSettings CaseReader::readLogging() const {
    LoggingSettings logging;
    try {
        const YAML::Node node = config_["logging"];
        if (node && node["level"]) {
            logging.level = Logger::parseLevel(node["level"].as<std::string>());
        }
        readValue(node, "file", logging.file);
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Invalid logging settings in " + filename_ + ": " + ex.what());
    }
    return logging;
}

CaseDescription CaseReader::readCase() const {
    CaseDescription description;
    try {
        readValue(config_, "name", description.name);

        // Grid
        const YAML::Node grid = config_["grid"];
        if (!grid) {
            throw ConfigurationError("No grid configuration found in " + filename_);
        }
        description.level = GridLevel(parseAxis(grid["z"], "z"),
                                      parseAxis(grid["y"], "y"),
                                      parseAxis(grid["x"], "x"));
        const YAML::Node origin = grid["origin"];
        readValue(origin, "latitude", description.originLatitude);
        readValue(origin, "longitude", description.originLongitude);

        // Radars
        const YAML::Node radars = config_["radars"];
        if (!radars || !radars.IsSequence() || radars.size() == 0) {
            throw ConfigurationError("At least one radar is required in " + filename_);
        }
        for (std::size_t i = 0; i < radars.size(); ++i) {
            const YAML::Node node = radars[i];
            RadarCase radar;
            radar.site.name = node["name"].as<std::string>("radar" + std::to_string(i));
            readValue(node, "x", radar.site.x);
            readValue(node, "y", radar.site.y);
            readValue(node, "altitude", radar.site.altitude);
            readValue(node, "latitude", radar.site.latitude);
            readValue(node, "longitude", radar.site.longitude);
            readValue(node, "velocityFile", radar.velocityFile);
            readValue(node, "reflectivityFile", radar.reflectivityFile);
            description.radars.push_back(radar);
        }

        // Analytic flow for radars without field files
        const YAML::Node synthetic = config_["synthetic"];
        if (synthetic) {
            SyntheticFlow flow;
            readValue(synthetic, "u0", flow.u0);
            readValue(synthetic, "v0", flow.v0);
            readValue(synthetic, "shear", flow.shear);
            readValue(synthetic, "wAmplitude", flow.wAmplitude);
            readValue(synthetic, "reflectivity", flow.reflectivity);
            description.synthetic = flow;
        }

        const YAML::Node sounding = config_["sounding"];
        if (sounding) {
            retrieval::Sounding s;
            s.z = parseVector(sounding["z"], "sounding z");
            s.u = parseVector(sounding["u"], "sounding u");
            s.v = parseVector(sounding["v"], "sounding v");
            description.sounding = s;
        }

        const YAML::Node initial = config_["initial"];
        readValue(initial, "u", description.initialU);
        readValue(initial, "v", description.initialV);
        readValue(initial, "w", description.initialW);

        const YAML::Node output = config_["output"];
        if (output && output["vtk"]) {
            description.vtkOutput = resolvePath(output["vtk"].as<std::string>());
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Invalid case description in " + filename_ + ": " + ex.what());
    }
    return description;
}

std::vector<Grid> CaseReader::loadGrids(const CaseDescription& description,
                                        const retrieval::RetrievalSettings& settings) const {
    const GridLevel& level = description.level;
    std::vector<Grid> grids;
    std::optional<WindField> truth;

    for (const RadarCase& radar : description.radars) {
        Grid grid;
        if (radar.velocityFile.empty()) {
            if (!description.synthetic) {
                throw ConfigurationError("Radar '" + radar.site.name +
                                         "' has no field files and the case has no synthetic flow");
            }
            if (!truth) {
                truth = synthesizeWinds(level, *description.synthetic);
            }
            MGWIND_LOG_INFO("Synthesising observations of radar {}", radar.site.name);
            grid = syntheticRadarGrid(level, radar.site, *truth, *description.synthetic,
                                      settings.velocityField, settings.reflectivityField,
                                      settings.freezingLevel);
        } else {
            if (radar.reflectivityFile.empty()) {
                throw ConfigurationError("Radar '" + radar.site.name + "' has no reflectivity file");
            }
            grid = Grid(level, radar.site);
            GridField vr(readRawField(resolvePath(radar.velocityFile), level.shape()), "m/s");
            vr.standardName = "radial_velocity_of_scatterers_away_from_instrument";
            vr.longName = "Corrected mean Doppler velocity";
            GridField refl(readRawField(resolvePath(radar.reflectivityFile), level.shape()), "dBZ");
            refl.standardName = "equivalent_reflectivity_factor";
            refl.longName = "Reflectivity";
            grid.addField(settings.velocityField, std::move(vr));
            grid.addField(settings.reflectivityField, std::move(refl));
        }
        grid.setOrigin(description.originLatitude, description.originLongitude);
        grids.push_back(std::move(grid));
    }
    return grids;
}

Field3D CaseReader::readRawField(const std::string& path, const Shape3& shape) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open field file: " + path);
    }

    std::vector<double> buffer(static_cast<std::size_t>(shape.size()));
    file.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size() * sizeof(double)));
    if (file.gcount() != static_cast<std::streamsize>(buffer.size() * sizeof(double))) {
        throw std::runtime_error("Field file " + path + " holds fewer than " +
                                 std::to_string(shape.size()) + " values");
    }

    VectorX values(shape.size());
    for (Index i = 0; i < shape.size(); ++i) {
        values[i] = static_cast<Real>(buffer[static_cast<std::size_t>(i)]);
    }
    return Field3D::fromFilled(shape, values);
}

void CaseReader::writeRawField(const std::string& path, const Field3D& field) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    VectorX values = field.filled(NaN);
    std::vector<double> buffer(static_cast<std::size_t>(values.size()));
    for (Index i = 0; i < values.size(); ++i) {
        buffer[static_cast<std::size_t>(i)] = static_cast<double>(values[i]);
    }
    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size() * sizeof(double)));
    if (!file) {
        throw std::runtime_error("Failed writing field file: " + path);
    }
}

std::string CaseReader::resolvePath(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute() || baseDir_.empty()) {
        return p.string();
    }
    return (fs::path(baseDir_) / p).string();
}

VectorX CaseReader::parseAxis(const YAML::Node& node, const std::string& name) {
    if (!node) {
        throw ConfigurationError("Grid axis '" + name + "' is missing");
    }
    if (node.IsSequence()) {
        return parseVector(node, name);
    }

    // {start, stop, count}: evenly spaced, both ends included
    const Real start = node["start"].as<Real>();
    const Real stop = node["stop"].as<Real>();
    const int count = node["count"].as<int>();
    if (count < 1) {
        throw ConfigurationError("Grid axis '" + name + "' needs at least one node");
    }
    VectorX axis(count);
    for (int i = 0; i < count; ++i) {
        axis[i] = count > 1 ? start + (stop - start) * i / (count - 1) : start;
    }
    return axis;
}

VectorX CaseReader::parseVector(const YAML::Node& node, const std::string& name) {
    if (!node || !node.IsSequence()) {
        throw ConfigurationError("'" + name + "' must be a list of numbers");
    }
    std::vector<Real> values = node.as<std::vector<Real>>();
    VectorX v(static_cast<Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        v[static_cast<Index>(i)] = values[i];
    }
    return v;
}

} // namespace mgwind::io
