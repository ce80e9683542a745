#ifndef SAFEHTTP_LOG_SPDLOG_LOGGER_HPP
#define SAFEHTTP_LOG_SPDLOG_LOGGER_HPP

#include "safehttp/log/logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogConfig
// ─────────────────────────────────────────────────────────────────────────────
// JSON form:
//   {"level": "warn", "console": false, "file": "safehttp.log", "async": true}
// Every key is optional. "level" takes spdlog's names (trace and critical are
// accepted and fold onto debug and error).

struct SpdlogConfig {
    using Json = nlohmann::json;

    /// [timestamp] [level] [file:line] message
    static constexpr const char* DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    LogLevel level = LogLevel::Info;
    bool console = true;                 // colored stderr sink
    std::optional<std::string> file;     // basic file sink, appended to
    bool async = false;                  // hand records to the shared spdlog pool
    std::string pattern = DEFAULT_PATTERN;

    SpdlogConfig& with_level(LogLevel l) { level = l; return *this; }
    SpdlogConfig& with_console(bool enabled) { console = enabled; return *this; }
    SpdlogConfig& with_file(std::string path) { file = std::move(path); return *this; }
    SpdlogConfig& with_async(bool enabled) { async = enabled; return *this; }
    SpdlogConfig& with_pattern(std::string p) { pattern = std::move(p); return *this; }

    /// Throws std::invalid_argument on an unknown level or a non-object
    [[nodiscard]] static SpdlogConfig from_json(const Json& j);
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger on top of an spdlog::logger. Loggers made here stay out of spdlog's
// registry, so any number can coexist.

class SpdlogLogger final : public ILogger {
public:
    /// Throws std::invalid_argument on null; the threshold is the logger's level
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel threshold = LogLevel::Info);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, threshold_);
    }

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept { return threshold_; }

    void set_pattern(const std::string& pattern) { logger_->set_pattern(pattern); }
    void flush() { logger_->flush(); }

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel threshold_;
};

/// Builds the sinks SpdlogConfig names. Throws std::invalid_argument when it
/// names none, spdlog::spdlog_ex when the file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogConfig& config = {});

}  // namespace safehttp

#endif  // SAFEHTTP_LOG_SPDLOG_LOGGER_HPP
