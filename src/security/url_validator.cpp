#include "safehttp/security/url_validator.hpp"
#include "safehttp/log/logger.hpp"

#include <ada.h>

#include <cctype>
#include <charconv>
#include <stdexcept>

namespace safehttp::security {

UrlValidationError UrlValidationError::make(Code code) {
    return {code, std::string(to_message(code))};
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

UrlValidatorConfig& UrlValidatorConfig::with_blacklist(RuleList list) {
    blacklist = std::move(list);
    return *this;
}

UrlValidatorConfig& UrlValidatorConfig::with_whitelist(RuleList list) {
    whitelist = std::move(list);
    return *this;
}

UrlValidatorConfig& UrlValidatorConfig::with_credentials_allowed(bool allowed) {
    allow_credentials = allowed;
    return *this;
}

UrlValidatorConfig UrlValidatorConfig::from_json(const Json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Validator configuration must be a JSON object");
    }

    UrlValidatorConfig config;
    if (j.contains("blacklist")) {
        config.blacklist = RuleList::from_json(j.at("blacklist"));
    }
    if (j.contains("whitelist")) {
        config.whitelist = RuleList::from_json(j.at("whitelist"));
    }
    config.allow_credentials = j.value("allow_credentials", false);
    return config;
}

namespace detail {

bool has_scheme(std::string_view url) {
    if (url.empty() || !std::isalpha(static_cast<unsigned char>(url.front()))) {
        return false;
    }
    for (std::size_t i = 1; i < url.size(); ++i) {
        const auto c = static_cast<unsigned char>(url[i]);
        if (c == ':') {
            return true;
        }
        const bool scheme_char = std::isalnum(c) || c == '+' || c == '-' || c == '.';
        if (!scheme_char) {
            return false;
        }
    }
    return false;
}

bool is_malformed(std::string_view url) {
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7F) return true;
    }

    // ada would skip the extra slash in "http:///host"; treat it as broken.
    // file:/// legitimately has an empty authority and fails later for
    // having no host.
    const auto authority = url.find("://");
    if (authority != std::string_view::npos) {
        std::string scheme(url.substr(0, authority));
        for (auto& c : scheme) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (scheme == "file") {
            return false;
        }
        const auto next = authority + 3;
        if (next >= url.size() || url[next] == '/' || url[next] == '\\') {
            return true;
        }
    }
    return false;
}

std::uint16_t default_port(std::string_view scheme) noexcept {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    if (scheme == "ftp") return 21;
    return 0;
}

std::string_view rule_host(std::string_view host) noexcept {
    if (host.size() > 1 && host.back() == '.') {
        host.remove_suffix(1);
    }
    return host;
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// UrlValidator
// ═══════════════════════════════════════════════════════════════════════════

UrlValidator::UrlValidator(UrlValidatorConfig config, std::shared_ptr<net::IResolver> resolver)
    : config_(std::move(config))
    , resolver_(std::move(resolver))
{
    if (resolver_ == nullptr) {
        throw std::invalid_argument("UrlValidator: resolver cannot be null");
    }
}

UrlValidator::UrlValidator(
    RuleList blacklist,
    RuleList whitelist,
    std::shared_ptr<net::IResolver> resolver
)
    : UrlValidator(
          UrlValidatorConfig{std::move(blacklist), std::move(whitelist), false},
          std::move(resolver))
{}

std::optional<UrlValidationError> UrlValidator::check_address(Ipv4Address address) const {
    using Code = UrlValidationError::Code;

    if (is_reserved(address) || config_.blacklist.matches_ip(address)) {
        return UrlValidationError::make(Code::AddressBlacklisted);
    }
    const bool restricted = !config_.whitelist.empty(RuleCategory::Ip);
    if (restricted && !config_.whitelist.matches_ip(address)) {
        return UrlValidationError::make(Code::AddressNotWhitelisted);
    }
    return std::nullopt;
}

UrlValidationResult UrlValidator::validate(const std::string& url) const {
    using Code = UrlValidationError::Code;

    const auto reject = [](Code code) {
        auto error = UrlValidationError::make(code);
        get_logger().warn_fmt("URL rejected: {}", error.message);
        return tl::unexpected(std::move(error));
    };

    // ─────────────────────────────────────────────────────────────────────
    // 1. Parse
    // ─────────────────────────────────────────────────────────────────────

    if (!detail::has_scheme(url)) {
        return reject(Code::NoHost);
    }
    if (detail::is_malformed(url)) {
        return reject(Code::UnableToParse);
    }

    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return reject(Code::UnableToParse);
    }
    const auto& ada_url = *parsed;

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return reject(Code::NoHost);
    }

    // ─────────────────────────────────────────────────────────────────────
    // 2. Credentials
    // ─────────────────────────────────────────────────────────────────────

    const bool has_credentials =
        !ada_url.get_username().empty() || !ada_url.get_password().empty();
    if (has_credentials && !config_.allow_credentials) {
        return reject(Code::CredentialsNotAllowed);
    }

    // ─────────────────────────────────────────────────────────────────────
    // 3. Scheme
    // ─────────────────────────────────────────────────────────────────────

    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }

    if (!config_.whitelist.empty(RuleCategory::Scheme) && !config_.whitelist.matches_scheme(scheme)) {
        return reject(Code::SchemeNotWhitelisted);
    }
    if (config_.blacklist.matches_scheme(scheme)) {
        return reject(Code::SchemeBlacklisted);
    }

    // ─────────────────────────────────────────────────────────────────────
    // 4. Port
    // ─────────────────────────────────────────────────────────────────────
    // ada drops a port equal to the scheme default, so an empty port string
    // means "default" for both named and IP-literal hosts.

    std::uint16_t port = detail::default_port(scheme);
    const std::string_view port_str = ada_url.get_port();
    if (!port_str.empty()) {
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{}) {
            return reject(Code::UnableToParse);
        }
    }

    if (!config_.whitelist.empty(RuleCategory::Port) && !config_.whitelist.matches_port(port)) {
        return reject(Code::PortNotWhitelisted);
    }
    if (config_.blacklist.matches_port(port)) {
        return reject(Code::PortBlacklisted);
    }

    // ─────────────────────────────────────────────────────────────────────
    // 5. Host
    // ─────────────────────────────────────────────────────────────────────

    // "example.com." names the same host as "example.com"
    const std::string rule_host(detail::rule_host(host));
    if (!config_.whitelist.empty(RuleCategory::Host) && !config_.whitelist.matches_host(rule_host)) {
        return reject(Code::HostNotWhitelisted);
    }
    if (config_.blacklist.matches_host(rule_host)) {
        return reject(Code::HostBlacklisted);
    }

    // ─────────────────────────────────────────────────────────────────────
    // 6./7. Addresses
    // ─────────────────────────────────────────────────────────────────────

    std::vector<Ipv4Address> ips;
    if (auto literal = Ipv4Address::parse(host)) {
        ips.push_back(*literal);
    } else if (host.front() == '[') {
        // IPv6 literal: IPv4 resolution is forced, nothing to connect to
        return reject(Code::UnableToResolve);
    } else {
        auto resolved = resolver_->resolve_ipv4(host);
        if (!resolved || resolved->empty()) {
            return reject(Code::UnableToResolve);
        }
        ips = std::move(*resolved);
    }

    for (const auto& address : ips) {
        if (auto error = check_address(address)) {
            get_logger().warn_fmt("URL rejected: {} ({} -> {})", error->message, host, address.to_string());
            return tl::unexpected(std::move(*error));
        }
    }

    ValidatedUrl result;
    result.url = std::string(ada_url.get_href());
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.ips = std::move(ips);

    get_logger().debug_fmt("URL accepted: {} ({} address(es))", result.url, result.ips.size());
    return result;
}

}  // namespace safehttp::security
