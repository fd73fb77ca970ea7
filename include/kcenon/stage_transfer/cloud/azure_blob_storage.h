/**
 * @file azure_blob_storage.h
 * @brief Azure Blob Storage client authorized by a SAS token
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_AZURE_BLOB_STORAGE_H
#define KCENON_STAGE_TRANSFER_CLOUD_AZURE_BLOB_STORAGE_H

#include "cloud_error.h"
#include "cloud_http_client.h"
#include "stage_info.h"
#include "storage_client.h"

#include <memory>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Translate an Azure error response
 *
 * The error code comes from the x-ms-error-code header, or from the
 * <Code> element of the body when the header is missing.
 */
[[nodiscard]] auto translate_azure_failure(const http_response& response) -> provider_failure;

/**
 * @brief Block id of a multipart part
 *
 * Every block of a blob must have an id of the same length, so the part
 * number is zero padded to six digits before base64 encoding.
 */
[[nodiscard]] auto make_block_id(const std::string& upload_id, uint32_t part_number)
    -> std::string;

/**
 * @brief Azure Blob Storage client
 *
 * Blobs are addressed as https://<account>.<suffix>/<container>/<blob>?<sas>
 * where the suffix is blob.core.windows.net unless the stage carries an
 * endpoint. An endpoint that contains a scheme is used verbatim as the
 * account URL.
 *
 * Multipart uploads use Put Block and Put Block List. Uncommitted blocks
 * are discarded by the service, so abort_multipart() sends nothing.
 */
class azure_blob_storage_client : public storage_client {
public:
    static constexpr const char* api_version = "2021-08-06";

    [[nodiscard]] static auto create(const stage_info& stage,
                                     std::shared_ptr<http_client_interface> http_client)
        -> result<std::shared_ptr<azure_blob_storage_client>>;

    ~azure_blob_storage_client() override;

    azure_blob_storage_client(const azure_blob_storage_client&) = delete;
    auto operator=(const azure_blob_storage_client&) -> azure_blob_storage_client& = delete;

    [[nodiscard]] auto provider() const -> provider_kind override {
        return provider_kind::azure;
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
     * @brief Container URL, without the SAS token
     */
    [[nodiscard]] auto container_url() const -> std::string;

private:
    struct impl;
    explicit azure_blob_storage_client(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_AZURE_BLOB_STORAGE_H
