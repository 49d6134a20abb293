#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace citerate {

namespace {

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::setLogFile(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (filepath.empty()) {
        return true;
    }
    file_.open(filepath, std::ios::app);
    return file_.is_open();
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warning(const std::string& source, const std::string& message) {
    log(LogLevel::WARNING, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    std::ostringstream line;
    line << currentTimestamp() << " [" << levelName(level) << "] "
         << "[" << source << "] " << message << '\n';

    std::clog << line.str();
    if (file_.is_open()) {
        file_ << line.str();
        file_.flush();
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;

    THROW_INVALID_PARAM("Logger::parseLevel", "Unknown log level '" + name + "'");
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace citerate
