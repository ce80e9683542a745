#pragma once

#include "safehttp/security/ipv4.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <string>
#include <vector>

namespace safehttp::net {

// ─────────────────────────────────────────────────────────────────────────────
// Resolve Error
// ─────────────────────────────────────────────────────────────────────────────

struct ResolveError {
    enum class Code {
        NotFound,  // Name has no A records
        Failed     // Resolver itself failed (network, configuration)
    };

    Code code;
    std::string message;

    static ResolveError not_found(const std::string& host) {
        return {Code::NotFound, "No IPv4 address for " + host};
    }
    static ResolveError failed(const std::string& msg) {
        return {Code::Failed, msg};
    }
};

template <typename T>
using ResolveResult = tl::expected<T, ResolveError>;

// ─────────────────────────────────────────────────────────────────────────────
// IResolver
// ─────────────────────────────────────────────────────────────────────────────
// Hostname -> IPv4 addresses. Only A records are requested; IPv6 is out of
// scope for the validator. Implementations return addresses in resolver order
// with duplicates removed, and never an empty list on success.
//
// Resolution is synchronous; any deadline belongs to the system resolver.

class IResolver {
public:
    virtual ~IResolver() = default;

    [[nodiscard]] virtual ResolveResult<std::vector<security::Ipv4Address>> resolve_ipv4(
        const std::string& host
    ) = 0;
};

// System resolver (getaddrinfo via asio::ip::tcp::resolver)
std::shared_ptr<IResolver> make_resolver();

}  // namespace safehttp::net
