/**
 * @file cloud_http_client.h
 * @brief HTTP client abstraction for the storage providers
 * @version 0.1.0
 *
 * Providers talk HTTP only through http_client_interface. The production
 * implementation wraps the network_system HTTP client; tests inject
 * scripted implementations.
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H
#define KCENON_STAGE_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H

#include "kcenon/stage_transfer/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::stage_transfer {

using http_headers = std::map<std::string, std::string>;

/**
 * @brief HTTP response returned to the providers
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    http_headers headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        };

        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief HTTP operations used by the storage providers
 *
 * An error result means the request never produced an HTTP response
 * (connection, DNS or TLS failure, timeout). Providers translate such
 * failures into transient_network.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url,
                     const std::map<std::string, std::string>& query,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::string& body,
                      const http_headers& headers) -> result<http_response> = 0;

    virtual auto put(const std::string& url,
                     const std::vector<uint8_t>& body,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto del(const std::string& url,
                     const http_headers& headers) -> result<http_response> = 0;

    virtual auto head(const std::string& url,
                      const http_headers& headers) -> result<http_response> = 0;
};

/**
 * @brief http_client_interface backed by network_system
 *
 * Without network_system every call fails with feature_unavailable.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class cloud_http_client : public http_client_interface {
public:
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(300000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(const std::string& url,
                           const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto head(const std::string& url,
                            const http_headers& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create cloud HTTP client
 */
[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(300000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H
