#ifndef SAFEHTTP_SECURITY_RULE_LIST_HPP
#define SAFEHTTP_SECURITY_RULE_LIST_HPP

#include "safehttp/security/ipv4.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace safehttp::security {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Rule Categories
// ═══════════════════════════════════════════════════════════════════════════

enum class RuleCategory {
    Scheme,
    Port,
    Host,
    Ip
};

[[nodiscard]] constexpr std::string_view to_string(RuleCategory category) noexcept {
    switch (category) {
        case RuleCategory::Scheme: return "scheme";
        case RuleCategory::Port:   return "port";
        case RuleCategory::Host:   return "host";
        case RuleCategory::Ip:     return "ip";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// RuleList
// ═══════════════════════════════════════════════════════════════════════════
// Ordered rules for the four URL parts. The same type serves as whitelist
// and as blacklist; the validator decides which role a list plays.
//
//   scheme, host : regex patterns, whole-value match, case-insensitive
//   port         : exact port numbers
//   ip           : IPv4 literals or CIDR ranges ("10.0.0.0/8")
//
// Entries are validated on insertion; a bad regex or address throws
// std::invalid_argument so a broken policy never reaches validation.
//
// Example:
//   auto whitelist = RuleList::default_whitelist();
//   whitelist.add_host(R"((.*)\.example\.com)").add_ip("93.184.216.34");

class RuleList {
public:
    RuleList() = default;

    /// Schemes {http, https}, ports {80, 443}; host and ip unrestricted
    [[nodiscard]] static RuleList default_whitelist();

    RuleList& add_scheme(const std::string& pattern);
    RuleList& add_port(std::uint16_t port);
    RuleList& add_host(const std::string& pattern);
    RuleList& add_ip(std::string_view address_or_cidr);

    [[nodiscard]] bool empty(RuleCategory category) const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] bool matches_scheme(std::string_view scheme) const;
    [[nodiscard]] bool matches_port(std::uint16_t port) const noexcept;
    [[nodiscard]] bool matches_host(std::string_view host) const;
    [[nodiscard]] bool matches_ip(Ipv4Address address) const noexcept;

    [[nodiscard]] std::vector<std::string> scheme_patterns() const;
    [[nodiscard]] const std::vector<std::uint16_t>& ports() const noexcept { return ports_; }
    [[nodiscard]] std::vector<std::string> host_patterns() const;
    [[nodiscard]] const std::vector<Ipv4Range>& ip_ranges() const noexcept { return ips_; }

    // ─────────────────────────────────────────────────────────────────────
    // JSON: {"scheme": [...], "port": [...], "host": [...], "ip": [...]}
    // ─────────────────────────────────────────────────────────────────────

    [[nodiscard]] Json to_json() const;
    static RuleList from_json(const Json& j);

private:
    struct Pattern {
        std::string source;
        std::regex compiled;
    };

    static Pattern compile(RuleCategory category, const std::string& pattern);
    static bool matches_any(const std::vector<Pattern>& patterns, std::string_view value);

    std::vector<Pattern> schemes_;
    std::vector<std::uint16_t> ports_;
    std::vector<Pattern> hosts_;
    std::vector<Ipv4Range> ips_;
};

}  // namespace safehttp::security

#endif  // SAFEHTTP_SECURITY_RULE_LIST_HPP
