#include "safehttp/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <stdexcept>

namespace safehttp {

namespace {

// Unregistered loggers still need distinct names for spdlog's %n
std::string next_logger_name() {
    static std::atomic<unsigned> counter{0};
    return "safehttp_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

// One worker shared by every async logger; lives until process exit
std::shared_ptr<spdlog::details::thread_pool> shared_async_pool() {
    static auto pool = std::make_shared<spdlog::details::thread_pool>(8192, 1);
    return pool;
}

LogLevel parse_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("SpdlogConfig: unknown log level '" + name + "'");
    }
    return SpdlogLogger::from_spdlog_level(level);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogConfig
// ─────────────────────────────────────────────────────────────────────────────

SpdlogConfig SpdlogConfig::from_json(const Json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("SpdlogConfig: expected a JSON object");
    }

    SpdlogConfig config;
    if (j.contains("level")) {
        config.level = parse_level(j.at("level").get<std::string>());
    }
    if (j.contains("console")) {
        config.console = j.at("console").get<bool>();
    }
    if (j.contains("file")) {
        config.file = j.at("file").get<std::string>();
    }
    if (j.contains("async")) {
        config.async = j.at("async").get<bool>();
    }
    if (j.contains("pattern")) {
        config.pattern = j.at("pattern").get<std::string>();
    }
    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    if (level == spdlog::level::off) {
        return LogLevel::Off;
    }
    if (level <= spdlog::level::debug) {
        return LogLevel::Debug;
    }
    if (level >= spdlog::level::err) {
        return LogLevel::Error;
    }
    return level == spdlog::level::warn ? LogLevel::Warn : LogLevel::Info;
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , threshold_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    threshold_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel threshold)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end()))
    , threshold_(threshold)
{
    logger_->set_pattern(SpdlogConfig::DEFAULT_PATTERN);
    logger_->set_level(to_spdlog_level(threshold));
}

void SpdlogLogger::set_level(LogLevel level) {
    threshold_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (config.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file));
    }
    if (sinks.empty()) {
        throw std::invalid_argument("SpdlogConfig: no console or file sink selected");
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        logger = std::make_shared<spdlog::async_logger>(
            next_logger_name(), sinks.begin(), sinks.end(),
            shared_async_pool(), spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end());
    }
    logger->set_pattern(config.pattern);
    logger->set_level(SpdlogLogger::to_spdlog_level(config.level));
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

}  // namespace safehttp
