/**
 * Logger backend
 *
 * One spdlog logger with a colour console sink. A file sink can be added
 * at runtime; both sinks share the logger level.
 */

#include "credrank/logging.hpp"
#include "credrank/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace credrank {

static constexpr const char* ENV_LOG_LEVEL = "CREDRANK_LOG_LEVEL";
static constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "off" || lowered == "none") return LogLevel::OFF;
    throw ConfigError("unknown log level '" + name + "'", __func__,
                      "use one of debug, info, warn, error, off");
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "info";
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("credrank", console_sink);
        logger->set_pattern(LOG_PATTERN);
        logger->flush_on(spdlog::level::warn);
    }

    void add_file_sink(const std::string& path) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        file_sink->set_pattern(LOG_PATTERN);
        logger->sinks().push_back(file_sink);
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : impl_(std::make_unique<Impl>()), level_(LogLevel::INFO) {
    if (const char* env = std::getenv(ENV_LOG_LEVEL)) {
        try {
            level_.store(parse_log_level(env));
        } catch (const ConfigError& e) {
            impl_->logger->warn("ignoring {}: {}", ENV_LOG_LEVEL, e.message());
        }
    }
    impl_->logger->set_level(to_spdlog(level_.load()));
}

Logger::~Logger() = default;

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_.store(level);
    impl_->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::setOutputFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        impl_->add_file_sink(path);
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError(std::string("cannot open log file: ") + e.what(), __func__);
    }
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    impl_->logger->log(to_spdlog(level), message);
}

} // namespace credrank
