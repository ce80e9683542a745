#pragma once

#include "safehttp/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// `message` is the backend's own text (libcurl's error buffer for the default
// client); `native_code` is its numeric code, 0 when there is none.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        ResolveFailed,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;
    int native_code{0};

    static HttpClientError connection_failed(const std::string& msg, int native = 0) {
        return {Code::ConnectionFailed, msg, native};
    }
    static HttpClientError timeout(const std::string& msg, int native = 0) {
        return {Code::Timeout, msg, native};
    }
    static HttpClientError ssl_error(const std::string& msg, int native = 0) {
        return {Code::SslError, msg, native};
    }
    static HttpClientError resolve_failed(const std::string& msg, int native = 0) {
        return {Code::ResolveFailed, msg, native};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled", 0};
    }
    static HttpClientError unknown(const std::string& msg, int native = 0) {
        return {Code::Unknown, msg, native};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string raw_headers;   // Status line and header block as received
    std::string body;
    std::string redirect_url;  // Absolute target; only set for redirect codes

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_redirect() const {
        return is_redirect_status(status_code);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// The one network resource the executor drives. A handle serves one logical
// request (possibly several hops) at a time and is not thread-safe.
//
// Contract the executor relies on:
// - set_follow_redirects(false) must stop the backend from chasing Location
//   on its own; every hop goes back through validation.
// - pin_host() applies to the next execute() only.
// - execute() never throws for network problems; it returns HttpClientError.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Request Configuration
    // ─────────────────────────────────────────────────────────────────────────

    virtual void set_url(const std::string& url) = 0;

    virtual void set_follow_redirects(bool follow) = 0;

    virtual void set_ipv4_only(bool ipv4_only) = 0;

    virtual void pin_host(const HostPin& pin) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Settings
    // ─────────────────────────────────────────────────────────────────────────

    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Whole-transfer deadline; 0 disables it
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Capabilities
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual bool supports_ipv4_only() const = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> execute() = 0;
};

// cpr/libcurl implementation
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace safehttp
