#include "safehttp/security/rule_list.hpp"

#include <algorithm>
#include <stdexcept>

namespace safehttp::security {

RuleList RuleList::default_whitelist() {
    RuleList list;
    list.add_scheme("http").add_scheme("https");
    list.add_port(80).add_port(443);
    return list;
}

// ═══════════════════════════════════════════════════════════════════════════
// Insertion
// ═══════════════════════════════════════════════════════════════════════════

RuleList::Pattern RuleList::compile(RuleCategory category, const std::string& pattern) {
    if (pattern.empty()) {
        throw std::invalid_argument(
            "Empty " + std::string(to_string(category)) + " pattern");
    }
    try {
        return Pattern{pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase)};
    } catch (const std::regex_error& e) {
        throw std::invalid_argument(
            "Invalid " + std::string(to_string(category)) + " pattern '" + pattern + "': " + e.what());
    }
}

RuleList& RuleList::add_scheme(const std::string& pattern) {
    schemes_.push_back(compile(RuleCategory::Scheme, pattern));
    return *this;
}

RuleList& RuleList::add_port(std::uint16_t port) {
    const bool already_listed = std::find(ports_.begin(), ports_.end(), port) != ports_.end();
    if (already_listed == false) {
        ports_.push_back(port);
    }
    return *this;
}

RuleList& RuleList::add_host(const std::string& pattern) {
    hosts_.push_back(compile(RuleCategory::Host, pattern));
    return *this;
}

RuleList& RuleList::add_ip(std::string_view address_or_cidr) {
    auto range = Ipv4Range::parse(address_or_cidr);
    if (!range) {
        throw std::invalid_argument(
            "Invalid ip rule '" + std::string(address_or_cidr) + "': expected IPv4 address or CIDR range");
    }
    ips_.push_back(*range);
    return *this;
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

bool RuleList::empty(RuleCategory category) const noexcept {
    switch (category) {
        case RuleCategory::Scheme: return schemes_.empty();
        case RuleCategory::Port:   return ports_.empty();
        case RuleCategory::Host:   return hosts_.empty();
        case RuleCategory::Ip:     return ips_.empty();
    }
    return true;
}

bool RuleList::empty() const noexcept {
    return schemes_.empty() && ports_.empty() && hosts_.empty() && ips_.empty();
}

bool RuleList::matches_any(const std::vector<Pattern>& patterns, std::string_view value) {
    return std::any_of(patterns.begin(), patterns.end(), [value](const Pattern& p) {
        return std::regex_match(value.begin(), value.end(), p.compiled);
    });
}

bool RuleList::matches_scheme(std::string_view scheme) const {
    return matches_any(schemes_, scheme);
}

bool RuleList::matches_port(std::uint16_t port) const noexcept {
    return std::find(ports_.begin(), ports_.end(), port) != ports_.end();
}

bool RuleList::matches_host(std::string_view host) const {
    return matches_any(hosts_, host);
}

bool RuleList::matches_ip(Ipv4Address address) const noexcept {
    return std::any_of(ips_.begin(), ips_.end(),
        [address](const Ipv4Range& range) { return range.contains(address); });
}

std::vector<std::string> RuleList::scheme_patterns() const {
    std::vector<std::string> out;
    out.reserve(schemes_.size());
    for (const auto& p : schemes_) out.push_back(p.source);
    return out;
}

std::vector<std::string> RuleList::host_patterns() const {
    std::vector<std::string> out;
    out.reserve(hosts_.size());
    for (const auto& p : hosts_) out.push_back(p.source);
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

Json RuleList::to_json() const {
    Json j = Json::object();
    j["scheme"] = scheme_patterns();
    j["port"] = ports_;

    j["host"] = host_patterns();

    Json ips = Json::array();
    for (const auto& range : ips_) {
        ips.push_back(range.to_string());
    }
    j["ip"] = std::move(ips);
    return j;
}

RuleList RuleList::from_json(const Json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Rule list must be a JSON object");
    }

    RuleList list;
    if (j.contains("scheme")) {
        for (const auto& pattern : j.at("scheme")) {
            list.add_scheme(pattern.get<std::string>());
        }
    }
    if (j.contains("port")) {
        for (const auto& port : j.at("port")) {
            const auto value = port.get<std::int64_t>();
            if (value < 0 || value > 65535) {
                throw std::invalid_argument("Invalid port rule: " + std::to_string(value));
            }
            list.add_port(static_cast<std::uint16_t>(value));
        }
    }
    if (j.contains("host")) {
        for (const auto& pattern : j.at("host")) {
            list.add_host(pattern.get<std::string>());
        }
    }
    if (j.contains("ip")) {
        for (const auto& ip : j.at("ip")) {
            list.add_ip(ip.get<std::string>());
        }
    }
    return list;
}

}  // namespace safehttp::security
