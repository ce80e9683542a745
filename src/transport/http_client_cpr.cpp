#include "safehttp/transport/http_client.hpp"
#include "safehttp/log/logger.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <set>
#include <utility>
#include <vector>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Every execute() runs on a fresh
// cpr::Session: libcurl keeps CURLOPT_RESOLVE entries in the handle's DNS
// cache, so a fresh handle is what makes a pin last exactly one request.
//
// Options cpr does not wrap (IPv4-only resolution, the computed redirect
// target) go straight to the underlying CURL handle.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Request Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_url(const std::string& url) override {
        url_ = url;
    }

    void set_follow_redirects(bool follow) override {
        follow_redirects_ = follow;
    }

    void set_ipv4_only(bool ipv4_only) override {
        ipv4_only_ = ipv4_only;
    }

    void pin_host(const HostPin& pin) override {
        pending_pins_.push_back(pin);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Settings
    // ─────────────────────────────────────────────────────────────────────────

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_timeout(std::chrono::milliseconds timeout) override {
        timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    // CURLOPT_IPRESOLVE appeared in libcurl 7.10.8
    bool supports_ipv4_only() const override {
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        return info != nullptr && info->version_num >= 0x070a08;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    HttpClientResult<HttpClientResponse> execute() override {
        // Pins are consumed by this request whatever its outcome
        std::vector<HostPin> pins;
        pins.swap(pending_pins_);

        cpr::Session session;
        session.SetUrl(cpr::Url{url_});
        session.SetRedirect(cpr::Redirect{follow_redirects_});
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
        session.SetTimeout(cpr::Timeout{timeout_});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});
        session.SetHeader(build_headers());

        if (!pins.empty()) {
            std::vector<cpr::Resolve> resolves;
            resolves.reserve(pins.size());
            for (const auto& pin : pins) {
                // libcurl accepts a comma-separated address list per entry
                resolves.emplace_back(pin.host, pin.addresses(), std::set<std::uint16_t>{pin.port});
                get_logger().debug_fmt("Pinning {}", pin.to_resolve_entry());
            }
            session.SetResolves(resolves);
        }

        CURL* handle = session.GetCurlHolder()->handle;
        if (ipv4_only_) {
            curl_easy_setopt(handle, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);
        }

        const cpr::Response response = session.Get();
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        result.raw_headers = response.raw_header;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }

        if (result.is_redirect()) {
            char* location = nullptr;
            const CURLcode rc = curl_easy_getinfo(handle, CURLINFO_REDIRECT_URL, &location);
            if (rc == CURLE_OK && location != nullptr) {
                result.redirect_url = location;
            }
        }

        return result;
    }

private:
    cpr::Header build_headers() const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    // libcurl's message is passed through untouched; callers match on it
    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const int native = static_cast<int>(error.code);

        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg, native);
        }

        const bool is_resolve_error =
            (msg.find("Could not resolve") != std::string::npos) ||
            (msg.find("resolve host") != std::string::npos);
        if (is_resolve_error) {
            return HttpClientError::resolve_failed(msg, native);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg, native);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg, native);
            default:
                return HttpClientError::connection_failed(msg, native);
        }
    }

    std::string url_;
    bool follow_redirects_{false};
    bool ipv4_only_{false};
    std::vector<HostPin> pending_pins_;

    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds timeout_{0};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace safehttp
