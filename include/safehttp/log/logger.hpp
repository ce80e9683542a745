#ifndef SAFEHTTP_LOG_LOGGER_HPP
#define SAFEHTTP_LOG_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <format>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────
// What the library emits at each level:
//   Debug  every request hop and every accepted URL
//   Info   a redirect that is being followed
//   Warn   a rejected URL, a redirect limit hit, a client without IPv4 forcing
//   Error  a transport failure

enum class LogLevel : std::uint8_t {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return level != LogLevel::Off && level >= threshold;
}

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(LogLevel lvl, std::string msg, std::source_location loc)
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backends implement log() and should_log(). The validator and the executor
// reach the installed backend through get_logger().

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, loc, msg);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, loc, msg);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, loc, msg);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, loc, msg);
    }

    // Arguments are formatted only when the level is enabled
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    void write(LogLevel level, const std::source_location& loc, std::string_view msg) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...),
                          std::source_location::current()));
        }
    }
};

// Installed until set_logger() replaces it
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// StreamLogger
// ─────────────────────────────────────────────────────────────────────────────
// One line per record: "safehttp LEVEL file:line message". The stream must
// outlive the logger.

class StreamLogger : public ILogger {
public:
    explicit StreamLogger(std::ostream& out, LogLevel threshold = LogLevel::Info)
        : out_(out)
        , threshold_(threshold)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, threshold_);
    }

    void set_level(LogLevel level) noexcept { threshold_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return threshold_; }

private:
    std::ostream& out_;
    LogLevel threshold_;
    std::mutex write_mutex_;
};

// StreamLogger bound to stderr
class ConsoleLogger final : public StreamLogger {
public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info);
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership; nullptr reinstalls the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

}  // namespace safehttp

#endif  // SAFEHTTP_LOG_LOGGER_HPP
