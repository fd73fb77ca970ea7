/**
 * @file gcs_storage.h
 * @brief Google Cloud Storage client (XML API)
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_GCS_STORAGE_H
#define KCENON_STAGE_TRANSFER_CLOUD_GCS_STORAGE_H

#include "cloud_error.h"
#include "cloud_http_client.h"
#include "stage_info.h"
#include "storage_client.h"

#include <memory>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Translate a GCS error response
 */
[[nodiscard]] auto translate_gcs_failure(const http_response& response) -> provider_failure;

/**
 * @brief GCS storage client
 *
 * Two credential modes are supported:
 * - downscoped bearer token: every operation, including XML multipart
 * - presigned URL: the URL addresses a single object, so the key argument
 *   is ignored; only upload, download, download_range and
 *   get_object_metadata are available and supports_multipart() is false
 *
 * Endpoint selection (token mode):
 * - endpoint override: https://<endpoint>/<bucket>/<key>
 * - use_regional_url:  https://storage.<region>.rep.googleapis.com/<bucket>/<key>
 * - otherwise:         https://storage.googleapis.com/<bucket>/<key>
 */
class gcs_storage_client : public storage_client {
public:
    [[nodiscard]] static auto create(const stage_info& stage,
                                     std::shared_ptr<http_client_interface> http_client)
        -> result<std::shared_ptr<gcs_storage_client>>;

    ~gcs_storage_client() override;

    gcs_storage_client(const gcs_storage_client&) = delete;
    auto operator=(const gcs_storage_client&) -> gcs_storage_client& = delete;

    [[nodiscard]] auto provider() const -> provider_kind override {
        return provider_kind::gcs;
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

    [[nodiscard]] auto supports_multipart() const -> bool override;

    [[nodiscard]] auto endpoint_url() const -> std::string;

private:
    struct impl;
    explicit gcs_storage_client(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_GCS_STORAGE_H
