#include "safehttp/client/safe_executor_config.hpp"

#include <cstdint>
#include <stdexcept>

namespace safehttp {

SafeExecutorConfig& SafeExecutorConfig::with_follow_redirects(bool follow) {
    follow_redirects = follow;
    return *this;
}

SafeExecutorConfig& SafeExecutorConfig::with_redirect_limit(std::size_t limit) {
    redirect_limit = limit;
    return *this;
}

SafeExecutorConfig& SafeExecutorConfig::with_output_headers(bool output) {
    output_headers = output;
    return *this;
}

SafeExecutorConfig SafeExecutorConfig::from_json(const Json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Executor configuration must be a JSON object");
    }

    SafeExecutorConfig config;
    config.follow_redirects = j.value("follow_redirects", config.follow_redirects);
    config.output_headers = j.value("output_headers", config.output_headers);

    if (j.contains("redirect_limit")) {
        const auto limit = j.at("redirect_limit").get<std::int64_t>();
        if (limit < 0) {
            throw std::invalid_argument("redirect_limit must be >= 0");
        }
        config.redirect_limit = static_cast<std::size_t>(limit);
    }
    return config;
}

SafeExecutorConfig::Json SafeExecutorConfig::to_json() const {
    return Json{
        {"follow_redirects", follow_redirects},
        {"redirect_limit", redirect_limit},
        {"output_headers", output_headers}
    };
}

}  // namespace safehttp
