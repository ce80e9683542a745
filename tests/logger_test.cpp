// ─────────────────────────────────────────────────────────────────────────────
// Logging Tests
// ─────────────────────────────────────────────────────────────────────────────
// What the validator and executor report, at which level, and how the
// stream backend renders it.

#include <catch2/catch_test_macros.hpp>

#include "safehttp/client/safe_executor.hpp"
#include "safehttp/log/logger.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/mock_resolver.hpp"

#include <algorithm>
#include <sstream>

using namespace safehttp;
using namespace safehttp::security;
using safehttp::testing::MockHttpClient;
using safehttp::testing::MockResolver;
using safehttp::testing::ScopedCapturingLogger;

namespace {

std::shared_ptr<MockResolver> public_resolver() {
    auto resolver = std::make_shared<MockResolver>();
    resolver->add("www.example.com", {"93.184.216.34"});
    resolver->add("final.example.com", {"93.184.216.60"});
    return resolver;
}

SafeExecutor make_executor(MockHttpClient*& http, SafeExecutorConfig config = {}) {
    auto client = std::make_unique<MockHttpClient>();
    http = client.get();
    return SafeExecutor(std::move(client), UrlValidator(UrlValidatorConfig{}, public_resolver()), config);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// What Gets Logged
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A rejected URL is logged once as a warning with its reason", "[log]") {
    ScopedCapturingLogger logger;
    UrlValidator validator(UrlValidatorConfig{}, public_resolver());

    auto result = validator.validate("ftp://www.example.com/");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(logger->count(LogLevel::Warn) == 1);
    REQUIRE(logger->contains(LogLevel::Warn, "URL rejected: Scheme is not whitelisted."));
}

TEST_CASE("A blocked address names the host and the address", "[log]") {
    ScopedCapturingLogger logger;
    auto resolver = public_resolver();
    resolver->add("internal.example.com", {"10.1.2.3"});
    UrlValidator validator(UrlValidatorConfig{}, resolver);

    REQUIRE_FALSE(validator.validate("http://internal.example.com/").has_value());
    REQUIRE(logger->contains(LogLevel::Warn, "internal.example.com -> 10.1.2.3"));
}

TEST_CASE("An accepted URL is only logged at debug", "[log]") {
    ScopedCapturingLogger logger;
    UrlValidator validator(UrlValidatorConfig{}, public_resolver());

    REQUIRE(validator.validate("http://www.example.com/").has_value());
    REQUIRE(logger->contains(LogLevel::Debug, "URL accepted: http://www.example.com/"));
    REQUIRE(logger->count(LogLevel::Warn) == 0);
}

TEST_CASE("Each request hop is logged at debug", "[log][executor]") {
    ScopedCapturingLogger logger;
    MockHttpClient* http{nullptr};
    auto executor = make_executor(http, SafeExecutorConfig{}.with_follow_redirects(true));
    http->queue_redirect(302, "http://final.example.com/");
    http->queue_response(200, "ok");

    REQUIRE(executor.execute("http://www.example.com/").has_value());
    REQUIRE(logger->contains(LogLevel::Debug, "Fetching http://www.example.com/ (hop 0)"));
    REQUIRE(logger->contains(LogLevel::Debug, "Fetching http://final.example.com/ (hop 1)"));
}

TEST_CASE("A followed redirect is logged at info with both ends", "[log][executor]") {
    ScopedCapturingLogger logger;
    MockHttpClient* http{nullptr};
    auto executor = make_executor(http, SafeExecutorConfig{}.with_follow_redirects(true));
    http->queue_redirect(301, "http://final.example.com/next");
    http->queue_response(200, "ok");

    REQUIRE(executor.execute("http://www.example.com/").has_value());
    REQUIRE(logger->count(LogLevel::Info) == 1);
    REQUIRE(logger->contains(LogLevel::Info,
        "Following HTTP 301 redirect http://www.example.com/ -> http://final.example.com/next"));
}

TEST_CASE("Hitting the redirect limit is logged as a warning", "[log][executor]") {
    ScopedCapturingLogger logger;
    MockHttpClient* http{nullptr};
    auto executor = make_executor(http,
        SafeExecutorConfig{}.with_follow_redirects(true).with_redirect_limit(1));
    http->queue_redirect(302, "http://final.example.com/");

    REQUIRE_FALSE(executor.execute("http://www.example.com/").has_value());
    REQUIRE(logger->contains(LogLevel::Warn, "Redirect limit 1 exceeded"));
    REQUIRE(logger->count(LogLevel::Info) == 0);
}

TEST_CASE("A transport failure is logged as an error naming the host", "[log][executor]") {
    ScopedCapturingLogger logger;
    MockHttpClient* http{nullptr};
    auto executor = make_executor(http);
    http->queue_timeout();

    REQUIRE_FALSE(executor.execute("http://www.example.com/").has_value());
    REQUIRE(logger->contains(LogLevel::Error, "HTTP request to www.example.com failed: Operation timed out"));
}

TEST_CASE("A warn threshold hides hop and redirect chatter", "[log][executor]") {
    ScopedCapturingLogger logger(LogLevel::Warn);
    MockHttpClient* http{nullptr};
    auto executor = make_executor(http, SafeExecutorConfig{}.with_follow_redirects(true));
    http->queue_redirect(302, "http://final.example.com/");
    http->queue_response(200, "ok");

    REQUIRE(executor.execute("http://www.example.com/").has_value());
    REQUIRE(logger->records().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Backends
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StreamLogger writes one prefixed line per record", "[log][stream]") {
    std::ostringstream out;
    StreamLogger logger(out, LogLevel::Info);

    logger.debug("hidden");
    logger.warn("URL rejected: Port is not whitelisted.");

    const auto text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.rfind("safehttp WARN  logger_test.cpp:", 0) == 0);
    REQUIRE(text.find(" URL rejected: Port is not whitelisted.\n") != std::string::npos);
    REQUIRE(std::count(text.begin(), text.end(), '\n') == 1);
}

TEST_CASE("StreamLogger threshold can be raised and switched off", "[log][stream]") {
    std::ostringstream out;
    StreamLogger logger(out, LogLevel::Debug);
    REQUIRE(logger.should_log(LogLevel::Debug));

    logger.set_level(LogLevel::Error);
    REQUIRE(logger.level() == LogLevel::Error);
    REQUIRE_FALSE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.should_log(LogLevel::Error));

    logger.set_level(LogLevel::Off);
    logger.error("dropped");
    REQUIRE(out.str().empty());
}

TEST_CASE("Off is never an emitted level", "[log]") {
    REQUIRE_FALSE(level_enabled(LogLevel::Off, LogLevel::Debug));
    REQUIRE(level_enabled(LogLevel::Error, LogLevel::Warn));
    REQUIRE_FALSE(level_enabled(LogLevel::Info, LogLevel::Warn));
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
}

TEST_CASE("Clearing the global logger silences the library", "[log]") {
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));

    UrlValidator validator(UrlValidatorConfig{}, public_resolver());
    REQUIRE_FALSE(validator.validate("http://127.0.0.1/").has_value());
}
