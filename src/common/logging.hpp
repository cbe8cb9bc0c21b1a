/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * logging.hpp - Leveled logging for the engine and the CLI
 *
 * Features:
 *   - Verbosity levels (TRACE, DEBUG, INFO, WARN, ERROR)
 *   - Output to stderr, a log file, or a callback
 *   - Colored output for terminals, timestamps for log files
 *   - {} placeholder formatting
 *
 * Log records never go to stdout: stdout may be carrying the wordlist.
 */

#ifndef LFICHEF_LOGGING_HPP
#define LFICHEF_LOGGING_HPP

#include <string>
#include <sstream>
#include <iostream>
#include <fstream>
#include <functional>
#include <mutex>
#include <memory>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace lfichef {

/**
 * Log levels in order of severity
 */
enum class LogLevel {
    Trace = 0,    // Per-payload detail
    Debug = 1,    // Parsed configuration, stage activation
    Info = 2,     // Run started/completed
    Warn = 3,     // Ignored options
    Error = 4,    // Validation and I/O failures
    Silent = 5
};

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Silent: return "SILENT";
        default: return "UNKNOWN";
    }
}

namespace colors {
    constexpr const char* Reset   = "\033[0m";
    constexpr const char* Red     = "\033[31m";
    constexpr const char* Green   = "\033[32m";
    constexpr const char* Yellow  = "\033[33m";
    constexpr const char* Cyan    = "\033[36m";
    constexpr const char* Bold    = "\033[1m";
    constexpr const char* Dim     = "\033[2m";
}

inline const char* logLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return colors::Dim;
        case LogLevel::Debug: return colors::Cyan;
        case LogLevel::Info:  return colors::Green;
        case LogLevel::Warn:  return colors::Yellow;
        case LogLevel::Error: return colors::Red;
        default: return colors::Reset;
    }
}

/**
 * Global logging configuration
 */
class LogConfig {
public:
    static LogConfig& get() {
        static LogConfig instance;
        return instance;
    }

    LogLevel minLevel = LogLevel::Info;
    bool useColors = true;
    bool showTimestamp = false;
    bool showLevel = true;
    bool showSource = true;
    std::ostream* output = &std::cerr;
    std::unique_ptr<std::ofstream> fileOutput;
    std::function<void(LogLevel, const std::string&, const std::string&)> callback;

    void setLevel(LogLevel level) {
        minLevel = level;
    }

    void setLevel(const std::string& level) {
        if (level == "trace" || level == "TRACE") minLevel = LogLevel::Trace;
        else if (level == "debug" || level == "DEBUG") minLevel = LogLevel::Debug;
        else if (level == "info" || level == "INFO") minLevel = LogLevel::Info;
        else if (level == "warn" || level == "WARN") minLevel = LogLevel::Warn;
        else if (level == "error" || level == "ERROR") minLevel = LogLevel::Error;
        else if (level == "silent" || level == "SILENT") minLevel = LogLevel::Silent;
    }

    /**
     * Map a CLI verbosity (0=quiet, 1=normal, 2=verbose, 3=trace)
     * onto a minimum level
     */
    void setVerbosity(int verbosity) {
        switch (verbosity) {
            case 0:  minLevel = LogLevel::Error; break;
            case 1:  minLevel = LogLevel::Info; break;
            case 2:  minLevel = LogLevel::Debug; break;
            default: minLevel = verbosity < 0 ? LogLevel::Silent : LogLevel::Trace; break;
        }
    }

    /**
     * Send log records to a file instead of stderr.
     * File records carry timestamps and no color codes.
     */
    bool setOutputFile(const std::string& path) {
        fileOutput = std::make_unique<std::ofstream>(path, std::ios::app);
        if (fileOutput->is_open()) {
            output = fileOutput.get();
            useColors = false;
            showTimestamp = true;
            return true;
        }
        fileOutput.reset();
        return false;
    }

    /**
     * Back to colored stderr output (used by tests)
     */
    void reset() {
        fileOutput.reset();
        output = &std::cerr;
        callback = nullptr;
        useColors = true;
        showTimestamp = false;
        minLevel = LogLevel::Info;
    }

private:
    LogConfig() = default;
};

/**
 * Logger class - one per component
 */
class Logger {
public:
    explicit Logger(const std::string& source = "lfichef")
        : source_(source) {}

    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) const {
        auto& config = LogConfig::get();

        if (level < config.minLevel) return;

        std::string message = formatString(format, std::forward<Args>(args)...);
        writeLog(level, message);
    }

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) const {
        log(LogLevel::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) const {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) const {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) const {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) const {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    bool enabled(LogLevel level) const {
        return level >= LogConfig::get().minLevel;
    }

    const std::string& source() const { return source_; }

private:
    std::string source_;
    static std::mutex mutex_;

    template<typename T>
    static std::string toString(const T& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    static std::string formatString(const std::string& format) {
        return format;
    }

    template<typename T, typename... Rest>
    static std::string formatString(const std::string& format, T&& value, Rest&&... rest) {
        size_t placeholder = format.find("{}");
        if (placeholder == std::string::npos) {
            return format;
        }

        std::string result = format.substr(0, placeholder);
        result += toString(std::forward<T>(value));
        result += formatString(format.substr(placeholder + 2), std::forward<Rest>(rest)...);
        return result;
    }

    void writeLog(LogLevel level, const std::string& message) const {
        auto& config = LogConfig::get();

        std::ostringstream oss;

        if (config.showTimestamp) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << " ";
        }

        if (config.showLevel) {
            if (config.useColors) {
                oss << logLevelColor(level);
            }
            oss << "[" << std::setw(5) << logLevelToString(level) << "]";
            if (config.useColors) {
                oss << colors::Reset;
            }
            oss << " ";
        }

        if (config.showSource && !source_.empty()) {
            if (config.useColors) {
                oss << colors::Bold;
            }
            oss << "[" << source_ << "]";
            if (config.useColors) {
                oss << colors::Reset;
            }
            oss << " ";
        }

        oss << message;

        std::lock_guard<std::mutex> lock(mutex_);
        *config.output << oss.str() << std::endl;

        if (config.callback) {
            config.callback(level, source_, message);
        }
    }
};

inline std::mutex Logger::mutex_;

#define LFICHEF_LOG(logger, level, ...) \
    logger.log(level, __VA_ARGS__)

#define LFICHEF_TRACE(logger, ...) logger.trace(__VA_ARGS__)
#define LFICHEF_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#define LFICHEF_INFO(logger, ...)  logger.info(__VA_ARGS__)
#define LFICHEF_WARN(logger, ...)  logger.warn(__VA_ARGS__)
#define LFICHEF_ERROR(logger, ...) logger.error(__VA_ARGS__)

inline Logger& globalLogger() {
    static Logger instance("lfichef");
    return instance;
}

#define LOG_TRACE(...) lfichef::globalLogger().trace(__VA_ARGS__)
#define LOG_DEBUG(...) lfichef::globalLogger().debug(__VA_ARGS__)
#define LOG_INFO(...)  lfichef::globalLogger().info(__VA_ARGS__)
#define LOG_WARN(...)  lfichef::globalLogger().warn(__VA_ARGS__)
#define LOG_ERROR(...) lfichef::globalLogger().error(__VA_ARGS__)

} // namespace lfichef

#endif // LFICHEF_LOGGING_HPP
