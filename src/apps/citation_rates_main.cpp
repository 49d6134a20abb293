#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "exceptions/Exceptions.hpp"
#include "model/AnalysisWriter.hpp"
#include "model/CitationDocumentReader.hpp"
#include "model/CitationRateAnalyser.hpp"
#include "model/RunConfiguration.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadRunConfiguration.hpp"
#include "utils/StringUtils.hpp"

using citerate::AnalysisReport;
using citerate::AnalysisWriter;
using citerate::CitationDocument;
using citerate::CitationDocumentReader;
using citerate::CitationRateAnalyser;
using citerate::InvalidParameterException;
using citerate::Logger;
using citerate::LogLevel;
using citerate::RunConfiguration;

namespace {

const std::string LOG_SOURCE = "citation_rates";

// Command-line values take precedence over the configuration file.
struct Args {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;

    std::optional<double> processVar;
    std::optional<double> obsVar;
    std::optional<double> obsOverdispersion;
    std::optional<double> minCount;
    std::optional<int> forecastYears;
    std::optional<std::uint64_t> seed;
    std::optional<int> threads;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName
        << " --input FILE --output FILE [--config FILE]\n"
        << "       [--process-var Q] [--obs-var R | --obs-overdispersion PHI] [--min-count C]\n"
        << "       [--forecast-years N] [--seed N] [--threads N] [--log-level debug|info|warning|error]"
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
        if (a == "--process-var") {
            args.processVar = parseNumber<double>("--process-var", requireValue("--process-var"));
            continue;
        }
        if (a == "--obs-var") {
            args.obsVar = parseNumber<double>("--obs-var", requireValue("--obs-var"));
            continue;
        }
        if (a == "--obs-overdispersion") {
            args.obsOverdispersion = parseNumber<double>("--obs-overdispersion",
                                                         requireValue("--obs-overdispersion"));
            continue;
        }
        if (a == "--min-count") {
            args.minCount = parseNumber<double>("--min-count", requireValue("--min-count"));
            continue;
        }
        if (a == "--forecast-years") {
            args.forecastYears = parseNumber<int>("--forecast-years", requireValue("--forecast-years"));
            continue;
        }
        if (a == "--seed") {
            args.seed = parseNumber<std::uint64_t>("--seed", requireValue("--seed"));
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
    if (args.obsVar && args.obsOverdispersion) {
        THROW_INVALID_PARAM("parseArgs", "--obs-var and --obs-overdispersion are mutually exclusive");
    }
    return args;
}

RunConfiguration buildConfiguration(const Args& args) {
    RunConfiguration config;
    if (!args.configPath.empty()) {
        citerate::readRunConfiguration(args.configPath, config);
    }

    if (args.processVar) config.process_var = *args.processVar;
    if (args.obsVar) config.obs_var = *args.obsVar;
    if (args.obsOverdispersion) {
        config.obs_overdispersion = *args.obsOverdispersion;
        config.obs_var.reset();
    }
    if (args.minCount) config.min_count = *args.minCount;
    if (args.forecastYears) config.forecast_years = *args.forecastYears;
    if (args.seed) config.seed = *args.seed;
    if (args.threads) config.threads = *args.threads;
    if (args.logLevel) config.log_level = Logger::parseLevel(*args.logLevel);
    if (args.logFile) config.log_file = *args.logFile;

    config.validate();
    return config;
}

} // namespace

int main(int argc, char** argv) {
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::INFO);

    try {
        const Args args = parseArgs(argc, argv);
        const RunConfiguration config = buildConfiguration(args);
        logger.setLogLevel(config.log_level);
        openLogFile(logger, config.log_file);

        if (config.obs_var) {
            logger.info(LOG_SOURCE, "Observation noise: constant R=" + std::to_string(*config.obs_var));
        } else {
            logger.info(LOG_SOURCE, "Observation noise: time-varying, phi=" +
                                    std::to_string(config.obs_overdispersion));
        }

        const CitationDocument document = CitationDocumentReader::readFile(args.inputPath);
        const CitationRateAnalyser analyser(config);
        const AnalysisReport report = analyser.analyse(document);

        AnalysisWriter writer;
        writer.saveAnalysis(args.outputPath, report);
        writer.waitForCompletion();

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
