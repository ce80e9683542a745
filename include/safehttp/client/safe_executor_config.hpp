#ifndef SAFEHTTP_CLIENT_SAFE_EXECUTOR_CONFIG_HPP
#define SAFEHTTP_CLIENT_SAFE_EXECUTOR_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstddef>

namespace safehttp {

// ─────────────────────────────────────────────────────────────────────────────
// Safe Executor Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct SafeExecutorConfig {
    using Json = nlohmann::json;

    // Follow 301/302/303/307/308 responses, re-validating every target.
    bool follow_redirects{false};

    // Upper bound on redirects when following; 0 = unlimited.
    // A hop is only taken while (hops taken + 1) < redirect_limit.
    std::size_t redirect_limit{0};

    // Prefix the returned body with the raw response headers.
    bool output_headers{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    SafeExecutorConfig& with_follow_redirects(bool follow);
    SafeExecutorConfig& with_redirect_limit(std::size_t limit);
    SafeExecutorConfig& with_output_headers(bool output);

    // {"follow_redirects": true, "redirect_limit": 5, "output_headers": false}
    static SafeExecutorConfig from_json(const Json& j);
    [[nodiscard]] Json to_json() const;
};

}  // namespace safehttp

#endif  // SAFEHTTP_CLIENT_SAFE_EXECUTOR_CONFIG_HPP
