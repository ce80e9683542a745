#include "safehttp/net/resolver.hpp"
#include "safehttp/log/logger.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <system_error>

namespace safehttp::net {

// ─────────────────────────────────────────────────────────────────────────────
// AsioResolver
// ─────────────────────────────────────────────────────────────────────────────
// Blocking resolve on a private io_context. The io_context is never run;
// the synchronous resolver overload does not need it.

class AsioResolver final : public IResolver {
public:
    AsioResolver() : resolver_(io_) {}

    ResolveResult<std::vector<security::Ipv4Address>> resolve_ipv4(
        const std::string& host
    ) override {
        std::error_code ec;
        const auto results = resolver_.resolve(asio::ip::tcp::v4(), host, "0", ec);

        if (ec) {
            get_logger().debug_fmt("DNS lookup for {} failed: {}", host, ec.message());
            const bool no_records =
                (ec == asio::error::host_not_found) ||
                (ec == asio::error::host_not_found_try_again) ||
                (ec == asio::error::no_data);
            if (no_records) {
                return tl::unexpected(ResolveError::not_found(host));
            }
            return tl::unexpected(ResolveError::failed(ec.message()));
        }

        std::vector<security::Ipv4Address> addresses;
        for (const auto& entry : results) {
            const auto address = entry.endpoint().address();
            if (!address.is_v4()) {
                continue;
            }
            const security::Ipv4Address ip{address.to_v4().to_uint()};
            const bool seen = std::find(addresses.begin(), addresses.end(), ip) != addresses.end();
            if (!seen) {
                addresses.push_back(ip);
            }
        }

        if (addresses.empty()) {
            return tl::unexpected(ResolveError::not_found(host));
        }

        get_logger().debug_fmt("Resolved {} to {} address(es)", host, addresses.size());
        return addresses;
    }

private:
    asio::io_context io_;
    asio::ip::tcp::resolver resolver_;
};

std::shared_ptr<IResolver> make_resolver() {
    return std::make_shared<AsioResolver>();
}

}  // namespace safehttp::net
