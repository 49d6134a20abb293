#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

namespace citerate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Process-wide logger.
 *
 * Messages are tagged with the component that emitted them and written to
 * std::clog, and optionally mirrored to a file. All methods are safe to
 * call from OpenMP worker threads.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Mirror all subsequent messages to a file (appending).
     *
     * An empty path stops mirroring.
     * @return false if the file could not be opened.
     */
    bool setLogFile(const std::string& filepath);

    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

    void log(LogLevel level, const std::string& source, const std::string& message);

    /**
     * @brief Parse "debug", "info", "warning" or "error" (case-insensitive).
     * @throws InvalidParameterException on an unknown name.
     */
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

} // namespace citerate

#endif // LOGGER_HPP
