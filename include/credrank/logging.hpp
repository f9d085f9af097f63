#pragma once

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace credrank {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Parses "debug", "info", "warn", "error" or "off"; throws ConfigError otherwise
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level) noexcept;

/**
 * Process-wide logger backed by a single spdlog logger named "credrank".
 *
 * The level is read once from CREDRANK_LOG_LEVEL and can be changed later
 * through setLevel() or the logging section of the configuration.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    // Adds a file sink next to the console sink
    void setOutputFile(const std::string& path);

    bool enabled(LogLevel level) const { return level != LogLevel::OFF && level >= level_.load(); }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        // Extract filename from path
        const char* filename = strrchr(file, '/');
        if (!filename) filename = strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::ostringstream msg;
        msg << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        write(level, msg.str());
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& message);

    void format_message(std::ostringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::ostringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<LogLevel> level_;
    mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) credrank::Logger::getInstance().log(credrank::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  credrank::Logger::getInstance().log(credrank::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  credrank::Logger::getInstance().log(credrank::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) credrank::Logger::getInstance().log(credrank::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

// Set log level convenience functions
inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_file(const std::string& path) {
    Logger::getInstance().setOutputFile(path);
}

} // namespace credrank
