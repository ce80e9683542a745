#include "safehttp/security/ipv4.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace safehttp::security {

namespace detail {

bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets) {
    std::size_t pos = 0;

    for (int i = 0; i < 4; ++i) {
        if (pos >= host.size()) return false;

        std::size_t end = host.find('.', pos);
        if (i < 3 && end == std::string_view::npos) return false;
        if (i == 3 && end != std::string_view::npos) return false;
        if (i == 3) end = host.size();

        std::string_view octet_str = host.substr(pos, end - pos);
        if (octet_str.empty() || octet_str.size() > 3) return false;

        for (char c : octet_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }

        int value = 0;
        auto [ptr, ec] = std::from_chars(octet_str.data(), octet_str.data() + octet_str.size(), value);
        if (ec != std::errc{} || value < 0 || value > 255) return false;

        octets[i] = static_cast<std::uint8_t>(value);
        pos = end + 1;
    }

    return true;
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Ipv4Address
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Ipv4Address> Ipv4Address::parse(std::string_view text) {
    std::array<std::uint8_t, 4> octets{};
    if (!detail::parse_ipv4(text, octets)) {
        return std::nullopt;
    }
    return from_octets(octets[0], octets[1], octets[2], octets[3]);
}

std::string Ipv4Address::to_string() const {
    return std::to_string((value >> 24) & 0xFF) + "." +
           std::to_string((value >> 16) & 0xFF) + "." +
           std::to_string((value >> 8) & 0xFF) + "." +
           std::to_string(value & 0xFF);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ipv4Range
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Ipv4Range> Ipv4Range::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        auto address = Ipv4Address::parse(text);
        if (!address) return std::nullopt;
        return Ipv4Range{*address, 32};
    }

    auto address = Ipv4Address::parse(text.substr(0, slash));
    if (!address) return std::nullopt;

    const std::string_view prefix_str = text.substr(slash + 1);
    if (prefix_str.empty() || prefix_str.size() > 2) return std::nullopt;

    int prefix = -1;
    auto [ptr, ec] = std::from_chars(prefix_str.data(), prefix_str.data() + prefix_str.size(), prefix);
    if (ec != std::errc{} || ptr != prefix_str.data() + prefix_str.size()) return std::nullopt;
    if (prefix < 0 || prefix > 32) return std::nullopt;

    return Ipv4Range{*address, static_cast<std::uint8_t>(prefix)};
}

std::string Ipv4Range::to_string() const {
    if (prefix_length == 32) {
        return network.to_string();
    }
    return network.to_string() + "/" + std::to_string(prefix_length);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reserved Ranges
// ═══════════════════════════════════════════════════════════════════════════

namespace {

constexpr std::array<Ipv4Range, 15> RESERVED_RANGES{{
    {Ipv4Address::from_octets(0, 0, 0, 0), 8},        // "this network"
    {Ipv4Address::from_octets(10, 0, 0, 0), 8},       // RFC 1918
    {Ipv4Address::from_octets(100, 64, 0, 0), 10},    // carrier-grade NAT
    {Ipv4Address::from_octets(127, 0, 0, 0), 8},      // loopback
    {Ipv4Address::from_octets(169, 254, 0, 0), 16},   // link-local, cloud metadata
    {Ipv4Address::from_octets(172, 16, 0, 0), 12},    // RFC 1918
    {Ipv4Address::from_octets(192, 0, 0, 0), 24},     // IETF protocol assignments
    {Ipv4Address::from_octets(192, 0, 2, 0), 24},     // TEST-NET-1
    {Ipv4Address::from_octets(192, 88, 99, 0), 24},   // 6to4 relay anycast
    {Ipv4Address::from_octets(192, 168, 0, 0), 16},   // RFC 1918
    {Ipv4Address::from_octets(198, 18, 0, 0), 15},    // benchmarking
    {Ipv4Address::from_octets(198, 51, 100, 0), 24},  // TEST-NET-2
    {Ipv4Address::from_octets(203, 0, 113, 0), 24},   // TEST-NET-3
    {Ipv4Address::from_octets(224, 0, 0, 0), 4},      // multicast
    {Ipv4Address::from_octets(240, 0, 0, 0), 4},      // reserved, broadcast
}};

}  // namespace

std::span<const Ipv4Range> reserved_ipv4_ranges() noexcept {
    return RESERVED_RANGES;
}

bool is_reserved(Ipv4Address address) noexcept {
    return std::any_of(RESERVED_RANGES.begin(), RESERVED_RANGES.end(),
        [address](const Ipv4Range& range) { return range.contains(address); });
}

}  // namespace safehttp::security
