#pragma once

#include "safehttp/security/ipv4.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Redirect Status Codes
// ─────────────────────────────────────────────────────────────────────────────
// 301 Moved Permanently, 302 Found, 303 See Other, 307 Temporary Redirect,
// 308 Permanent Redirect. 300 and 304 carry no single target.

[[nodiscard]] constexpr bool is_redirect_status(int status_code) noexcept {
    switch (status_code) {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return true;
        default:
            return false;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// HostPin
// ─────────────────────────────────────────────────────────────────────────────
// Forces connections to host:port onto already-validated addresses for the
// next request, so a second DNS answer cannot redirect the connection.

struct HostPin {
    std::string host;
    std::uint16_t port{0};
    std::vector<security::Ipv4Address> ips;

    // libcurl CURLOPT_RESOLVE form: "host:port:ip1,ip2"
    [[nodiscard]] std::string addresses() const {
        std::string joined;
        for (const auto& ip : ips) {
            if (!joined.empty()) {
                joined += ',';
            }
            joined += ip.to_string();
        }
        return joined;
    }

    [[nodiscard]] std::string to_resolve_entry() const {
        return host + ":" + std::to_string(port) + ":" + addresses();
    }
};

}  // namespace safehttp
