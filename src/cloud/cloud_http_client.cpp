/**
 * @file cloud_http_client.cpp
 * @brief network_system backed HTTP client
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/cloud_http_client.h"

#include "kcenon/stage_transfer/config/feature_flags.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <string_view>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::stage_transfer {

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;

    explicit impl(std::chrono::milliseconds timeout)
        : client(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

    /**
     * @brief Run one request and translate its outcome
     *
     * A request that produced no response at all is reported as
     * transient_network so the retry executor can try again.
     */
    template <typename Call>
    auto dispatch(std::string_view method, const std::string& url, Call&& call)
        -> result<http_response> {
        auto outcome = call(*client);
        if (outcome.is_err()) {
            ST_LOG_DEBUG(log_category::storage,
                std::string(method) + " " + url + " produced no response");
            return unexpected{error{error_code::transient_network,
                std::string(method) + " request failed before a response arrived"}};
        }

        const auto& raw = outcome.value();
        http_response response;
        response.status_code = raw.status_code;
        response.headers = raw.headers;
        response.body.assign(raw.body.begin(), raw.body.end());
        return response;
    }
#else
    explicit impl(std::chrono::milliseconds /*timeout*/) {}

    template <typename Call>
    auto dispatch(std::string_view method, const std::string& /*url*/, Call&& /*call*/)
        -> result<http_response> {
        return unexpected{error{error_code::feature_unavailable,
            std::string(method) + " needs network_system (built without BUILD_WITH_NETWORK_SYSTEM)"}};
    }
#endif
};

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

auto cloud_http_client::get(const std::string& url,
                            const std::map<std::string, std::string>& query,
                            const http_headers& headers) -> result<http_response> {
    return impl_->dispatch("GET", url, [&](auto& client) {
        return client.get(url, query, headers);
    });
}

auto cloud_http_client::post(const std::string& url,
                             const std::string& body,
                             const http_headers& headers) -> result<http_response> {
    return impl_->dispatch("POST", url, [&](auto& client) {
        return client.post(url, body, headers);
    });
}

auto cloud_http_client::put(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const http_headers& headers) -> result<http_response> {
    return impl_->dispatch("PUT", url, [&](auto& client) {
        return client.put(url, std::string(body.begin(), body.end()), headers);
    });
}

auto cloud_http_client::del(const std::string& url,
                            const http_headers& headers) -> result<http_response> {
    return impl_->dispatch("DELETE", url, [&](auto& client) {
        return client.del(url, headers);
    });
}

auto cloud_http_client::head(const std::string& url,
                             const http_headers& headers) -> result<http_response> {
    return impl_->dispatch("HEAD", url, [&](auto& client) {
        return client.head(url, headers);
    });
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return KCENON_WITH_NETWORK_SYSTEM != 0;
}

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::stage_transfer
