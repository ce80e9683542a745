#ifndef SAFEHTTP_SECURITY_IPV4_HPP
#define SAFEHTTP_SECURITY_IPV4_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace safehttp::security {

// ═══════════════════════════════════════════════════════════════════════════
// Ipv4Address
// ═══════════════════════════════════════════════════════════════════════════
// Host-order 32-bit IPv4 address. Only strict dotted-quad text is accepted
// (a.b.c.d, each 0-255, no leading '+', no hex/octal forms); URL hosts reach
// this type after ada has normalised the shorthand forms.

struct Ipv4Address {
    std::uint32_t value{0};

    [[nodiscard]] static std::optional<Ipv4Address> parse(std::string_view text);

    [[nodiscard]] static constexpr Ipv4Address from_octets(
        std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) noexcept {
        return Ipv4Address{
            (static_cast<std::uint32_t>(a) << 24) |
            (static_cast<std::uint32_t>(b) << 16) |
            (static_cast<std::uint32_t>(c) << 8) |
            static_cast<std::uint32_t>(d)
        };
    }

    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const Ipv4Address&) const noexcept = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Ipv4Range
// ═══════════════════════════════════════════════════════════════════════════
// CIDR block. A bare address parses as a /32.

struct Ipv4Range {
    Ipv4Address network;
    std::uint8_t prefix_length{32};

    [[nodiscard]] static std::optional<Ipv4Range> parse(std::string_view text);

    [[nodiscard]] constexpr std::uint32_t mask() const noexcept {
        return prefix_length == 0 ? 0U : (~std::uint32_t{0} << (32 - prefix_length));
    }

    [[nodiscard]] constexpr bool contains(Ipv4Address address) const noexcept {
        return (address.value & mask()) == (network.value & mask());
    }

    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const Ipv4Range&) const noexcept = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Reserved Ranges
// ═══════════════════════════════════════════════════════════════════════════
// Always-on blacklist: "this network", RFC 1918 private, shared address
// space, loopback, link-local (cloud metadata), IETF protocol assignments,
// documentation nets, 6to4 relay, benchmarking, multicast and reserved.

[[nodiscard]] std::span<const Ipv4Range> reserved_ipv4_ranges() noexcept;

[[nodiscard]] bool is_reserved(Ipv4Address address) noexcept;

namespace detail {

// a.b.c.d where each is 0-255
[[nodiscard]] bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets);

}  // namespace detail

}  // namespace safehttp::security

#endif  // SAFEHTTP_SECURITY_IPV4_HPP
