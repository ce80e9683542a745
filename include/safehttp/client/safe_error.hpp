#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Safe Executor Error
// ═══════════════════════════════════════════════════════════════════════════
// Everything SafeExecutor::execute() can fail with. The originating
// validation or transport error is kept alongside the flat message so
// callers can branch on the precise reason.

#include "safehttp/security/url_validator.hpp"
#include "safehttp/transport/http_client.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace safehttp {

enum class SafeErrorCode {
    InvalidUrl,             ///< Rejected by the URL validator (initial URL or a redirect hop)
    Transport,              ///< The HTTP client failed (connect, TLS, timeout, runtime DNS)
    RedirectLimitExceeded   ///< More redirects than the configured limit allows
};

[[nodiscard]] constexpr std::string_view to_string(SafeErrorCode code) noexcept {
    switch (code) {
        case SafeErrorCode::InvalidUrl:            return "InvalidUrl";
        case SafeErrorCode::Transport:             return "Transport";
        case SafeErrorCode::RedirectLimitExceeded: return "RedirectLimitExceeded";
    }
    return "Unknown";
}

struct SafeError {
    SafeErrorCode code;
    std::string message;
    std::optional<security::UrlValidationError> validation;
    std::optional<HttpClientError> transport;

    [[nodiscard]] static SafeError invalid_url(security::UrlValidationError err) {
        std::string msg = err.message;
        return {SafeErrorCode::InvalidUrl, std::move(msg), std::move(err), std::nullopt};
    }

    [[nodiscard]] static SafeError transport_error(HttpClientError err) {
        std::string msg = err.message;
        return {SafeErrorCode::Transport, std::move(msg), std::nullopt, std::move(err)};
    }

    [[nodiscard]] static SafeError redirect_limit_exceeded() {
        return {SafeErrorCode::RedirectLimitExceeded, "Redirect limit exceeded.", std::nullopt, std::nullopt};
    }
};

template <typename T>
using SafeResult = tl::expected<T, SafeError>;

}  // namespace safehttp
