// === apps/mgwind-retrieve/main.cpp ===
#include <algorithm>
#include <iostream>
#include <chrono>
#include <cmath>
#include <map>
#include <string>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/CaseReader.hpp"
#include "mgwind/io/Logger.hpp"
#include "mgwind/io/VTKWriter.hpp"
#include "mgwind/retrieval/ResultAssembler.hpp"
#include "mgwind/retrieval/WindRetrieval.hpp"

using namespace mgwind;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <case_file>\n"
              << "\nOptions:\n"
              << "  -h, --help                Show this help message\n"
              << "  -v, --verbose             Enable debug output\n"
              << "  -q, --quiet               Only report warnings and errors\n"
              << "  -o, --output <file.vtk>   Override the VTK output file\n"
              << "  -n, --max-iterations <n>  Override the multigrid iteration maximum\n"
              << "  -l, --log-file <file>     Also log to a file\n"
              << "\nCase files are YAML (.yaml, .yml) or JSON (.json).\n";
}

struct RetrieveOptions {
    std::string caseFile;
    std::string output;
    std::string logFile;
    bool verbose = false;
    bool quiet = false;
    int maxIterations = -1;
};

RetrieveOptions parseArguments(int argc, char* argv[]) {
    RetrieveOptions opts;

    if (argc < 2) {
        printUsage(argv[0]);
        std::exit(1);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                std::exit(1);
            }
            opts.output = argv[++i];
        } else if (arg == "-n" || arg == "--max-iterations") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -n requires an argument\n";
                std::exit(1);
            }
            try {
                opts.maxIterations = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: -n expects an integer, got " << argv[i] << "\n";
                std::exit(1);
            }
        } else if (arg == "-l" || arg == "--log-file") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -l requires an argument\n";
                std::exit(1);
            }
            opts.logFile = argv[++i];
        } else if (arg[0] != '-') {
            opts.caseFile = arg;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            printUsage(argv[0]);
            std::exit(1);
        }
    }

    if (opts.caseFile.empty()) {
        std::cerr << "Error: No case file specified\n";
        printUsage(argv[0]);
        std::exit(1);
    }

    return opts;
}

// Constant first guess; the sounding feeds the background constraint
retrieval::RetrievalInputs initialInputs(const io::CaseDescription& description) {
    const Shape3& shape = description.level.shape();
    retrieval::RetrievalInputs inputs;
    inputs.u0 = Field3D(shape, description.initialU);
    inputs.v0 = Field3D(shape, description.initialV);
    inputs.w0 = Field3D(shape, description.initialW);
    inputs.sounding = description.sounding;
    return inputs;
}

std::map<std::string, Real> windSummary(const WindField& winds) {
    std::map<std::string, Real> summary;
    const char* names[3] = {"u", "v", "w"};
    for (WindComponent c : ALL_COMPONENTS) {
        Real lo = 0.0, hi = 0.0, sum = 0.0;
        Index count = 0;
        auto values = winds.component(c);
        for (Index p = 0; p < values.size(); ++p) {
            if (!std::isfinite(values[p])) {
                continue;
            }
            lo = count == 0 ? values[p] : std::min(lo, values[p]);
            hi = count == 0 ? values[p] : std::max(hi, values[p]);
            sum += values[p];
            ++count;
        }
        const std::string name = names[static_cast<int>(c)];
        summary[name + " min"] = lo;
        summary[name + " max"] = hi;
        summary[name + " mean"] = count > 0 ? sum / static_cast<Real>(count) : Real(0);
    }
    return summary;
}

int main(int argc, char* argv[]) {
    RetrieveOptions opts = parseArguments(argc, argv);

    try {
        io::Logger* logger = io::Logger::getInstance();

        io::CaseReader reader(opts.caseFile);
        io::CaseConfig config = reader.read();

        // Command line overrides the case file
        io::Logger::Level level = config.logging.level;
        if (opts.verbose) {
            level = io::Logger::Level::DEBUG;
        } else if (opts.quiet) {
            level = io::Logger::Level::WARN;
        }
        const std::string logFile = opts.logFile.empty() ? config.logging.file : opts.logFile;
        logger->initialize(logFile, level);

        if (!opts.output.empty()) {
            config.description.vtkOutput = opts.output;
        }
        if (opts.maxIterations >= 0) {
            config.settings.multigrid.maxIterations = opts.maxIterations;
        }

        logger->info("========================================");
        logger->info("mgwind multigrid wind retrieval v1.0.0");
        logger->info("========================================");
        logger->info("Case: {} ({})", config.description.name, opts.caseFile);

        auto startTime = std::chrono::steady_clock::now();

        std::vector<Grid> grids = reader.loadGrids(config.description, config.settings);
        retrieval::RetrievalInputs inputs = initialInputs(config.description);
        retrieval::RetrievalResult result = retrieval::retrieveWinds(grids, inputs, config.settings);

        if (!result.history.empty()) {
            const solvers::CycleDiagnostics& first = result.history.front();
            const solvers::CycleDiagnostics& last = result.history.back();
            logger->info("Cost function: {:.6e} -> {:.6e} over {} cycle(s)",
                         first.costBeforeRelaxation, last.costAfterCorrection,
                         result.history.size());
        }
        logger->logSummary("Retrieved winds", windSummary(result.winds));

        if (!config.description.vtkOutput.empty()) {
            io::VTKWriter writer(config.description.level, config.description.name);
            writer.addVectorField("wind", result.winds);
            const Grid& out = result.grids.front();
            for (const std::string& name : {retrieval::U_FIELD, retrieval::V_FIELD,
                                            retrieval::W_FIELD}) {
                writer.addField(name, out.field(name).data);
            }
            writer.addField("observation_coverage", Field3D(config.description.level.shape(),
                                                            retrieval::combinedWeight(result.weights)));
            writer.write(config.description.vtkOutput);
            logger->info("Wrote {}", config.description.vtkOutput);
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        logger->info("========================================");
        logger->info("Retrieval completed successfully");
        logger->info("Total elapsed time: {:.3f} seconds", elapsed.count() / 1000.0);
        logger->info("========================================");
        logger->flush();

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
