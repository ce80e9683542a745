#include "safehttp/client/safe_executor.hpp"
#include "safehttp/log/logger.hpp"

#include <stdexcept>

namespace safehttp {

namespace {

// Per-call state of one execute(); never stored on the executor
struct ExecutionSession {
    std::string current_url;
    std::size_t redirect_count{0};
    std::size_t redirect_limit{0};
    bool follow_redirects{false};
    bool output_headers{false};

    // A further hop is allowed while (hops taken + 1) < limit; 0 = no limit
    [[nodiscard]] bool may_follow() const noexcept {
        return redirect_limit == 0 || (redirect_count + 1) < redirect_limit;
    }
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SafeExecutor::SafeExecutor()
    : SafeExecutor(make_http_client())
{}

SafeExecutor::SafeExecutor(
    std::unique_ptr<IHttpClient> client,
    security::UrlValidator validator,
    SafeExecutorConfig config
)
    : client_(std::move(client))
    , validator_(std::move(validator))
    , config_(config)
{
    if (client_ == nullptr) {
        throw std::invalid_argument("SafeExecutor: HTTP client cannot be null");
    }
    init_client();
}

void SafeExecutor::init_client() {
    // Redirects are followed here, one validated hop at a time
    client_->set_follow_redirects(false);

    if (client_->supports_ipv4_only()) {
        client_->set_ipv4_only(true);
    } else {
        get_logger().warn("HTTP client cannot force IPv4 resolution");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

SafeResult<std::string> SafeExecutor::execute(const std::string& url) {
    ExecutionSession session{
        url,
        0,
        config_.redirect_limit,
        config_.follow_redirects,
        config_.output_headers
    };

    while (true) {
        auto validated = validator_.validate(session.current_url);
        if (!validated) {
            return tl::unexpected(SafeError::invalid_url(std::move(validated.error())));
        }

        client_->pin_host(HostPin{validated->host, validated->port, validated->ips});
        client_->set_url(validated->url);

        get_logger().debug_fmt("Fetching {} (hop {})", validated->url, session.redirect_count);

        auto response = client_->execute();
        if (!response) {
            get_logger().error_fmt("HTTP request to {} failed: {}", validated->host, response.error().message);
            return tl::unexpected(SafeError::transport_error(std::move(response.error())));
        }

        // A redirect status always hops; an empty target fails validation below
        const bool is_final = !session.follow_redirects || !response->is_redirect();
        if (is_final) {
            get_logger().debug_fmt("HTTP {} from {}", response->status_code, validated->host);
            if (session.output_headers) {
                return response->raw_headers + response->body;
            }
            return std::move(response->body);
        }

        if (!session.may_follow()) {
            get_logger().warn_fmt("Redirect limit {} exceeded at {}", session.redirect_limit, validated->url);
            return tl::unexpected(SafeError::redirect_limit_exceeded());
        }

        ++session.redirect_count;
        get_logger().info_fmt("Following HTTP {} redirect {} -> {}",
            response->status_code, validated->url, response->redirect_url);
        session.current_url = std::move(response->redirect_url);
    }
}

}  // namespace safehttp
