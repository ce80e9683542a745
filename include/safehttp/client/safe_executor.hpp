#ifndef SAFEHTTP_CLIENT_SAFE_EXECUTOR_HPP
#define SAFEHTTP_CLIENT_SAFE_EXECUTOR_HPP

#include "safehttp/client/safe_error.hpp"
#include "safehttp/client/safe_executor_config.hpp"
#include "safehttp/security/url_validator.hpp"
#include "safehttp/transport/http_client.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace safehttp {

// ═══════════════════════════════════════════════════════════════════════════
// SafeExecutor
// ═══════════════════════════════════════════════════════════════════════════
// Runs an HTTP GET only after the URL has passed the validator, and repeats
// that check for every redirect it follows:
//
//   validate(url) -> pin host:port to the validated IPs -> execute
//       -> redirect? -> validate(target) -> ...
//
// The pin is re-issued on every hop from that hop's own validation, so the
// connection can only go to an address that was just checked.
//
// The transport's own redirect handling is switched off at construction and
// IPv4-only resolution is forced where the transport supports it.
//
// Usage:
//   SafeExecutor executor(make_http_client());
//   executor.set_follow_redirects(true);
//   executor.set_redirect_limit(5);
//   auto body = executor.execute("https://example.com/feed");
//   if (!body) {
//       // body.error().code, body.error().message
//   }
//
// Not thread-safe: one executor drives one transport handle. Per-call state
// lives on the stack of execute(), so sequential reuse is fine.

class SafeExecutor {
public:
    /// Default cpr transport, default validator
    SafeExecutor();

    /// Throws std::invalid_argument if client is null
    explicit SafeExecutor(
        std::unique_ptr<IHttpClient> client,
        security::UrlValidator validator = security::UrlValidator{},
        SafeExecutorConfig config = {}
    );

    ~SafeExecutor() = default;

    SafeExecutor(const SafeExecutor&) = delete;
    SafeExecutor& operator=(const SafeExecutor&) = delete;
    SafeExecutor(SafeExecutor&&) noexcept = default;
    SafeExecutor& operator=(SafeExecutor&&) noexcept = default;

    /// Fetch url; returns the final body (with headers if output_headers)
    [[nodiscard]] SafeResult<std::string> execute(const std::string& url);

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_follow_redirects(bool follow) noexcept { config_.follow_redirects = follow; }
    [[nodiscard]] bool follow_redirects() const noexcept { return config_.follow_redirects; }

    void set_redirect_limit(std::size_t limit) noexcept { config_.redirect_limit = limit; }
    [[nodiscard]] std::size_t redirect_limit() const noexcept { return config_.redirect_limit; }

    void set_output_headers(bool output) noexcept { config_.output_headers = output; }
    [[nodiscard]] bool output_headers() const noexcept { return config_.output_headers; }

    [[nodiscard]] const SafeExecutorConfig& config() const noexcept { return config_; }

    void set_validator(security::UrlValidator validator) { validator_ = std::move(validator); }
    [[nodiscard]] const security::UrlValidator& validator() const noexcept { return validator_; }

    /// The underlying transport, e.g. to adjust timeouts
    [[nodiscard]] IHttpClient& client() noexcept { return *client_; }

private:
    void init_client();

    std::unique_ptr<IHttpClient> client_;
    security::UrlValidator validator_;
    SafeExecutorConfig config_;
};

}  // namespace safehttp

#endif  // SAFEHTTP_CLIENT_SAFE_EXECUTOR_HPP
