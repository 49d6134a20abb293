#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "exceptions/Exceptions.hpp"
#include "model/AnalysisWriter.hpp"
#include "model/CitationDocumentReader.hpp"
#include "model/RunConfiguration.hpp"
#include "utils/FileUtils.hpp"
#include "model/TuningRunner.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadRunConfiguration.hpp"
#include "utils/StringUtils.hpp"

using citerate::AnalysisWriter;
using citerate::CitationDocument;
using citerate::CitationDocumentReader;
using citerate::InvalidParameterException;
using citerate::Logger;
using citerate::LogLevel;
using citerate::RunConfiguration;
using citerate::TuningReport;
using citerate::TuningRunner;

namespace {

const std::string LOG_SOURCE = "tune_hyperparameters";

struct Args {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;

    std::optional<double> minCount;
    std::optional<int> nGrid;
    std::optional<int> threads;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName
        << " --input FILE --output FILE [--config FILE] [--min-count C] [--n-grid N]"
        << " [--threads N] [--log-level debug|info|warning|error]"
        << " [--log-file FILE]\n";
}

void openLogFile(Logger& logger, const std::string& path) {
    if (path.empty()) {
        return;
    }
    citerate::FileUtils::ensureParentDirectoryExists(path);
    if (!logger.setLogFile(path)) {
        throw citerate::FileIOException(LOG_SOURCE, "Cannot open log file " + path);
    }
}

template <typename T>
T parseNumber(const char* flag, const std::string& text) {
    T value{};
    if (!citerate::StringUtils::stringToType(text, value)) {
        THROW_INVALID_PARAM("parseArgs", std::string("Invalid value '") + text + "' for " + flag);
    }
    return value;
}

Args parseArgs(int argc, char** argv) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto requireValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                THROW_INVALID_PARAM("parseArgs", std::string("Missing value after ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        }
        if (a == "--input") {
            args.inputPath = requireValue("--input");
            continue;
        }
        if (a == "--output") {
            args.outputPath = requireValue("--output");
            continue;
        }
        if (a == "--config") {
            args.configPath = requireValue("--config");
            continue;
        }
        if (a == "--min-count") {
            args.minCount = parseNumber<double>("--min-count", requireValue("--min-count"));
            continue;
        }
        if (a == "--n-grid") {
            args.nGrid = parseNumber<int>("--n-grid", requireValue("--n-grid"));
            continue;
        }
        if (a == "--threads") {
            args.threads = parseNumber<int>("--threads", requireValue("--threads"));
            continue;
        }
        if (a == "--log-level") {
            args.logLevel = requireValue("--log-level");
            continue;
        }
        if (a == "--log-file") {
            args.logFile = requireValue("--log-file");
            continue;
        }

        THROW_INVALID_PARAM("parseArgs", "Unknown argument: " + a);
    }

    if (args.inputPath.empty() || args.outputPath.empty()) {
        THROW_INVALID_PARAM("parseArgs", "--input and --output are required");
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::INFO);

    try {
        const Args args = parseArgs(argc, argv);

        RunConfiguration config;
        if (!args.configPath.empty()) {
            citerate::readRunConfiguration(args.configPath, config);
        }
        if (args.minCount) config.min_count = *args.minCount;
        if (args.nGrid) config.n_grid = *args.nGrid;
        if (args.threads) config.threads = *args.threads;
        if (args.logLevel) config.log_level = Logger::parseLevel(*args.logLevel);
        if (args.logFile) config.log_file = *args.logFile;
        config.validate();
        logger.setLogLevel(config.log_level);
        openLogFile(logger, config.log_file);

        const CitationDocument document = CitationDocumentReader::readFile(args.inputPath);
        const TuningRunner runner(config);
        const TuningReport report = runner.run(document, args.inputPath);

        AnalysisWriter writer;
        writer.saveTuningReport(args.outputPath, report);
        writer.waitForCompletion();

        std::cout << std::setprecision(6)
                  << "Optimal process variance (Q): " << report.grid.best_process_var << "\n"
                  << "Optimal overdispersion (phi): " << report.grid.best_overdispersion << "\n"
                  << "Log-likelihood: " << report.grid.best_log_likelihood << "\n";

        logger.info(LOG_SOURCE, "Results saved to " + args.outputPath);
        return 0;
    } catch (const std::exception& e) {
        logger.error(LOG_SOURCE, e.what());
        if (dynamic_cast<const InvalidParameterException*>(&e) != nullptr) {
            printUsage(argv[0]);
        }
        return 1;
    }
}
