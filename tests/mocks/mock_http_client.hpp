#ifndef SAFEHTTP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define SAFEHTTP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "safehttp/transport/http_client.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safehttp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Queue canned responses, redirects and transport errors
// - Verify which URL and pin each request went out with
// - Toggle the IPv4-only capability
//
// The executor owns its client, so tests keep a raw pointer obtained before
// handing the unique_ptr over.

struct RecordedRequest {
    std::string url;
    std::optional<HostPin> pin;
    bool follow_redirects{false};
    bool ipv4_only{false};
};

class MockHttpClient final : public IHttpClient {
public:
    explicit MockHttpClient(bool supports_ipv4 = true)
        : supports_ipv4_(supports_ipv4)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup - Queue Responses
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const std::string& raw_headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        HttpClientResponse response;
        response.status_code = status_code;
        response.raw_headers = raw_headers;
        response.body = body;
        resp.result = std::move(response);
        response_queue_.push_back(std::move(resp));
    }

    // Queue a redirect; the target is reported the way the cpr client does
    void queue_redirect(int status_code, const std::string& location) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        HttpClientResponse response;
        response.status_code = status_code;
        response.headers["Location"] = location;
        response.redirect_url = location;
        resp.result = std::move(response);
        response_queue_.push_back(std::move(resp));
    }

    void queue_error(HttpClientError::Code code, const std::string& message, int native_code = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.error = HttpClientError{code, message, native_code};
        response_queue_.push_back(std::move(resp));
    }

    void queue_connection_error(const std::string& message = "Failed to connect to server") {
        queue_error(HttpClientError::Code::ConnectionFailed, message, 7);
    }

    void queue_timeout(const std::string& message = "Operation timed out after 1000 milliseconds") {
        queue_error(HttpClientError::Code::Timeout, message, 28);
    }

    void set_supports_ipv4(bool supported) {
        std::lock_guard<std::mutex> lock(mutex_);
        supports_ipv4_ = supported;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification - Check Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    [[nodiscard]] bool follow_redirects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return follow_redirects_;
    }

    [[nodiscard]] bool ipv4_only() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ipv4_only_;
    }

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] std::chrono::milliseconds timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_url(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        url_ = url;
    }

    void set_follow_redirects(bool follow) override {
        std::lock_guard<std::mutex> lock(mutex_);
        follow_redirects_ = follow;
    }

    void set_ipv4_only(bool ipv4_only) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ipv4_only_ = ipv4_only;
    }

    void pin_host(const HostPin& pin) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_pin_ = pin;
    }

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    [[nodiscard]] bool supports_ipv4_only() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return supports_ipv4_;
    }

    HttpClientResult<HttpClientResponse> execute() override {
        std::lock_guard<std::mutex> lock(mutex_);

        RecordedRequest req;
        req.url = url_;
        req.pin = std::move(pending_pin_);
        req.follow_redirects = follow_redirects_;
        req.ipv4_only = ipv4_only_;
        requests_.push_back(std::move(req));
        pending_pin_.reset();

        if (response_queue_.empty()) {
            HttpClientResponse ok;
            ok.status_code = 200;
            return ok;
        }

        auto queued = std::move(response_queue_.front());
        response_queue_.pop_front();

        if (queued.error.has_value()) {
            return tl::unexpected(*queued.error);
        }
        return *queued.result;
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    mutable std::mutex mutex_;
    std::string url_;
    std::optional<HostPin> pending_pin_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds timeout_{0};
    bool follow_redirects_{true};
    bool ipv4_only_{false};
    bool verify_ssl_{true};
    bool supports_ipv4_{true};

    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
};

}  // namespace safehttp::testing

#endif  // SAFEHTTP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
