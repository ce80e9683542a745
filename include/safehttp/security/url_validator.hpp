#ifndef SAFEHTTP_SECURITY_URL_VALIDATOR_HPP
#define SAFEHTTP_SECURITY_URL_VALIDATOR_HPP

#include "safehttp/net/resolver.hpp"
#include "safehttp/security/ipv4.hpp"
#include "safehttp/security/rule_list.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safehttp::security {

// ═══════════════════════════════════════════════════════════════════════════
// URL Validation Error
// ═══════════════════════════════════════════════════════════════════════════
// One code per rejection reason. Messages are stable and part of the API;
// callers may match on either.

struct UrlValidationError {
    enum class Code {
        UnableToParse,
        NoHost,
        CredentialsNotAllowed,
        SchemeNotWhitelisted,
        SchemeBlacklisted,
        PortNotWhitelisted,
        PortBlacklisted,
        HostNotWhitelisted,
        HostBlacklisted,
        UnableToResolve,
        AddressBlacklisted,
        AddressNotWhitelisted
    };

    Code code;
    std::string message;

    [[nodiscard]] static UrlValidationError make(Code code);
};

[[nodiscard]] constexpr std::string_view to_message(UrlValidationError::Code code) noexcept {
    using Code = UrlValidationError::Code;
    switch (code) {
        case Code::UnableToParse:         return "Unable to parse URL.";
        case Code::NoHost:                return "No host found in URL.";
        case Code::CredentialsNotAllowed: return "Credentials not allowed as part of the URL.";
        case Code::SchemeNotWhitelisted:  return "Scheme is not whitelisted.";
        case Code::SchemeBlacklisted:     return "Scheme is blacklisted.";
        case Code::PortNotWhitelisted:    return "Port is not whitelisted.";
        case Code::PortBlacklisted:       return "Port is blacklisted.";
        case Code::HostNotWhitelisted:    return "Host is not whitelisted.";
        case Code::HostBlacklisted:       return "Host is blacklisted.";
        case Code::UnableToResolve:       return "Unable to resolve host.";
        case Code::AddressBlacklisted:    return "Host resolves to a blacklisted address.";
        case Code::AddressNotWhitelisted: return "Host does not resolve to a whitelisted address.";
    }
    return "Invalid URL.";
}

// ═══════════════════════════════════════════════════════════════════════════
// Validated URL
// ═══════════════════════════════════════════════════════════════════════════
// Produced by a successful validation and consumed at once by the executor.
// `ips` is never empty; those are the only addresses the request may use.

struct ValidatedUrl {
    std::string url;       // WHATWG-serialised href
    std::string scheme;    // "http"
    std::string host;      // "www.example.com" or "1.1.1.1"
    std::uint16_t port{0}; // explicit or scheme default
    std::vector<Ipv4Address> ips;
};

using UrlValidationResult = tl::expected<ValidatedUrl, UrlValidationError>;

// ═══════════════════════════════════════════════════════════════════════════
// URL Validator Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct UrlValidatorConfig {
    // User blacklist. The reserved IPv4 ranges are applied on top of it
    // regardless of what this list contains.
    RuleList blacklist;

    // Empty categories place no restriction. Replacing the default drops the
    // http/https and 80/443 restrictions unless the new list carries them.
    RuleList whitelist = RuleList::default_whitelist();

    // user:pass@host
    bool allow_credentials{false};

    UrlValidatorConfig& with_blacklist(RuleList list);
    UrlValidatorConfig& with_whitelist(RuleList list);
    UrlValidatorConfig& with_credentials_allowed(bool allowed);

    // {"blacklist": {...}, "whitelist": {...}, "allow_credentials": false}
    static UrlValidatorConfig from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// URL Validator
// ═══════════════════════════════════════════════════════════════════════════
// Stages, first failure wins:
//   1. parse (ada-url, WHATWG), host required
//   2. credentials
//   3. scheme  whitelist, then blacklist
//   4. port    whitelist, then blacklist (missing port = scheme default)
//   5. host    whitelist, then blacklist
//   6. address IPv4 literal taken as-is, otherwise resolved; every address
//              is checked against reserved ranges, user blacklist, then
//              user whitelist
//
// The validator holds no per-call state. Validating the same URL twice yields
// the same url/host/port; ips may differ if DNS changes in between.

class UrlValidator {
public:
    explicit UrlValidator(
        UrlValidatorConfig config = {},
        std::shared_ptr<net::IResolver> resolver = net::make_resolver()
    );

    UrlValidator(
        RuleList blacklist,
        RuleList whitelist,
        std::shared_ptr<net::IResolver> resolver = net::make_resolver()
    );

    [[nodiscard]] UrlValidationResult validate(const std::string& url) const;

    void set_credentials_allowed(bool allowed) noexcept { config_.allow_credentials = allowed; }
    [[nodiscard]] bool credentials_allowed() const noexcept { return config_.allow_credentials; }

    [[nodiscard]] const RuleList& blacklist() const noexcept { return config_.blacklist; }
    [[nodiscard]] const RuleList& whitelist() const noexcept { return config_.whitelist; }

private:
    [[nodiscard]] std::optional<UrlValidationError> check_address(Ipv4Address address) const;

    UrlValidatorConfig config_;
    std::shared_ptr<net::IResolver> resolver_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Internal Helpers (exposed for testing)
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

// RFC 3986 scheme followed by ':'
[[nodiscard]] bool has_scheme(std::string_view url);

// Control characters, spaces, or an empty authority ("http:///path");
// file:/// is left to the host check
[[nodiscard]] bool is_malformed(std::string_view url);

// 80/443 for http/https and ws/wss, 21 for ftp, 0 otherwise
[[nodiscard]] std::uint16_t default_port(std::string_view scheme) noexcept;

// Host as seen by host rules: one trailing root dot removed
[[nodiscard]] std::string_view rule_host(std::string_view host) noexcept;

}  // namespace detail

}  // namespace safehttp::security

#endif  // SAFEHTTP_SECURITY_URL_VALIDATOR_HPP
