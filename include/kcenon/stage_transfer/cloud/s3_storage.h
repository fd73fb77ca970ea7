/**
 * @file s3_storage.h
 * @brief S3 storage client with SigV4 request signing
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_S3_STORAGE_H
#define KCENON_STAGE_TRANSFER_CLOUD_S3_STORAGE_H

#include "cloud_config.h"
#include "cloud_error.h"
#include "cloud_http_client.h"
#include "stage_info.h"
#include "storage_client.h"

#include <map>
#include <memory>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Inputs of one SigV4 signature
 */
struct sigv4_request {
    std::string method;
    /// Absolute path, already URL encoded
    std::string canonical_uri;
    /// Sorted, encoded query string
    std::string canonical_query;
    /// Headers to sign (host, x-amz-date and x-amz-* included)
    std::map<std::string, std::string> headers;
    std::string payload_hash;
    /// YYYYMMDD'T'HHMMSS'Z'
    std::string amz_date;
};

/**
 * @brief Compute the SigV4 Authorization header value
 */
[[nodiscard]] auto sign_sigv4(const sigv4_request& request,
                              const temporary_keys& keys,
                              const std::string& region) -> std::string;

/**
 * @brief Translate an S3 error response
 */
[[nodiscard]] auto translate_s3_failure(const http_response& response) -> provider_failure;

/**
 * @brief S3 storage client
 *
 * Endpoint selection:
 * - endpoint override: https://<endpoint>/<bucket>/<key> (path style)
 * - use_regional_url:  https://<bucket>.s3.<region>.amazonaws.com/<key>
 * - otherwise:         https://<bucket>.s3.amazonaws.com/<key>
 */
class s3_storage_client : public storage_client {
public:
    /**
     * @brief Create a client for an S3 stage
     * @return credential_resolution_failed when the stage has no temporary keys
     */
    [[nodiscard]] static auto create(const stage_info& stage,
                                     std::shared_ptr<http_client_interface> http_client)
        -> result<std::shared_ptr<s3_storage_client>>;

    ~s3_storage_client() override;

    s3_storage_client(const s3_storage_client&) = delete;
    auto operator=(const s3_storage_client&) -> s3_storage_client& = delete;

    [[nodiscard]] auto provider() const -> provider_kind override {
        return provider_kind::s3;
    }

    [[nodiscard]] auto upload(const std::string& key,
                              std::span<const std::byte> data,
                              const object_metadata& metadata)
        -> result<uint64_t> override;

    [[nodiscard]] auto download(const std::string& key) -> result<byte_buffer> override;

    [[nodiscard]] auto download_range(const std::string& key, uint64_t offset, uint64_t length)
        -> result<byte_buffer> override;

    [[nodiscard]] auto get_object_metadata(const std::string& key)
        -> result<object_metadata> override;

    [[nodiscard]] auto list(const std::string& prefix)
        -> result<std::vector<object_summary>> override;

    [[nodiscard]] auto delete_object(const std::string& key) -> result<void> override;

    [[nodiscard]] auto begin_multipart(const std::string& key, const object_metadata& metadata)
        -> result<multipart_upload> override;

    [[nodiscard]] auto upload_part(const multipart_upload& upload,
                                   uint32_t part_number,
                                   std::span<const std::byte> data)
        -> result<completed_part> override;

    [[nodiscard]] auto complete_multipart(const multipart_upload& upload,
                                          const std::vector<completed_part>& parts)
        -> result<void> override;

    [[nodiscard]] auto abort_multipart(const multipart_upload& upload) -> result<void> override;

    /**
     * @brief Scheme and host every request is sent to
     */
    [[nodiscard]] auto endpoint_url() const -> std::string;

private:
    struct impl;
    explicit s3_storage_client(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_S3_STORAGE_H
