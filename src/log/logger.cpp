#include "safehttp/log/logger.hpp"

#include <iostream>
#include <ostream>

namespace safehttp {

namespace {

std::string_view file_basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> logger = std::make_unique<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger instance;
    return instance;
}

}  // namespace

void StreamLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    auto line = std::format("safehttp {:<5} {}:{} {}\n",
        to_string(record.level),
        file_basename(record.location.file_name()),
        record.location.line(),
        record.message);

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line;
    out_.flush();
}

ConsoleLogger::ConsoleLogger(LogLevel threshold)
    : StreamLogger(std::cerr, threshold)
{}

ILogger& get_logger() noexcept {
    auto& g = global();
    std::lock_guard<std::mutex> lock(g.mutex);
    return *g.logger;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& g = global();
    std::lock_guard<std::mutex> lock(g.mutex);
    if (logger == nullptr) {
        logger = std::make_unique<NullLogger>();
    }
    g.logger = std::move(logger);
}

}  // namespace safehttp
