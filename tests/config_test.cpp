// ─────────────────────────────────────────────────────────────────────────────
// Executor Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "safehttp/client/safe_executor_config.hpp"
#include "safehttp/client/safe_error.hpp"

#include <stdexcept>

using namespace safehttp;
using Json = SafeExecutorConfig::Json;

TEST_CASE("Executor config defaults", "[config]") {
    SafeExecutorConfig config;

    REQUIRE_FALSE(config.follow_redirects);
    REQUIRE(config.redirect_limit == 0);
    REQUIRE_FALSE(config.output_headers);
}

TEST_CASE("Executor config builder chains", "[config]") {
    auto config = SafeExecutorConfig{}
        .with_follow_redirects(true)
        .with_redirect_limit(5)
        .with_output_headers(true);

    REQUIRE(config.follow_redirects);
    REQUIRE(config.redirect_limit == 5);
    REQUIRE(config.output_headers);
}

TEST_CASE("Executor config loads from JSON", "[config][json]") {
    auto config = SafeExecutorConfig::from_json(Json::parse(R"({
        "follow_redirects": true,
        "redirect_limit": 3
    })"));

    REQUIRE(config.follow_redirects);
    REQUIRE(config.redirect_limit == 3);
    REQUIRE_FALSE(config.output_headers);
}

TEST_CASE("Executor config JSON round-trips", "[config][json]") {
    auto config = SafeExecutorConfig{}.with_follow_redirects(true).with_redirect_limit(7);

    auto j = config.to_json();

    REQUIRE(j["follow_redirects"] == true);
    REQUIRE(j["redirect_limit"] == 7);
    REQUIRE(j["output_headers"] == false);

    auto reloaded = SafeExecutorConfig::from_json(j);
    REQUIRE(reloaded.follow_redirects);
    REQUIRE(reloaded.redirect_limit == 7);
}

TEST_CASE("Invalid executor config JSON throws", "[config][json]") {
    REQUIRE_THROWS_AS(SafeExecutorConfig::from_json(Json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(
        SafeExecutorConfig::from_json(Json::parse(R"({"redirect_limit": -1})")),
        std::invalid_argument);
    REQUIRE_THROWS_AS(
        SafeExecutorConfig::from_json(Json::parse(R"({"redirect_limit": "five"})")),
        Json::type_error);
}

TEST_CASE("SafeError factories keep the originating error", "[config][error]") {
    auto invalid = SafeError::invalid_url(
        security::UrlValidationError::make(security::UrlValidationError::Code::PortNotWhitelisted));
    REQUIRE(invalid.code == SafeErrorCode::InvalidUrl);
    REQUIRE(invalid.message == "Port is not whitelisted.");
    REQUIRE(invalid.validation.has_value());
    REQUIRE_FALSE(invalid.transport.has_value());

    auto transport = SafeError::transport_error(HttpClientError::timeout("Operation timed out", 28));
    REQUIRE(transport.code == SafeErrorCode::Transport);
    REQUIRE(transport.message == "Operation timed out");
    REQUIRE(transport.transport->native_code == 28);

    auto limit = SafeError::redirect_limit_exceeded();
    REQUIRE(limit.code == SafeErrorCode::RedirectLimitExceeded);
    REQUIRE(limit.message == "Redirect limit exceeded.");

    REQUIRE(to_string(SafeErrorCode::Transport) == "Transport");
}
