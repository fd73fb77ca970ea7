/**
 * @file storage_client.h
 * @brief Provider-agnostic storage client interface
 * @version 0.1.0
 *
 * Object keys passed to a storage_client are relative to the stage
 * location; the client prepends the stage prefix. Listing returns keys in
 * the same relative form.
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_H
#define KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_H

#include "kcenon/stage_transfer/cloud/stage_info.h"
#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/core/types.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Handle of an in-progress multipart upload
 */
struct multipart_upload {
    std::string key;
    /// Provider upload id (S3, GCS) or block id prefix (Azure)
    std::string upload_id;
    /// Metadata applied when the upload is completed (Azure commits it then)
    object_metadata metadata;
};

/**
 * @brief Part acknowledged by the provider
 */
struct completed_part {
    uint32_t part_number = 0;
    /// ETag (S3, GCS) or block id (Azure)
    std::string etag;
    uint64_t size = 0;
};

/**
 * @brief Capability interface implemented by every storage provider
 *
 * Implementations translate native failures into the shared error
 * taxonomy and never retry; retries belong to retry_executor.
 */
class storage_client {
public:
    virtual ~storage_client() = default;

    [[nodiscard]] virtual auto provider() const -> provider_kind = 0;

    /**
     * @brief Store an object in one request
     * @return Number of bytes stored
     */
    [[nodiscard]] virtual auto upload(const std::string& key,
                                      std::span<const std::byte> data,
                                      const object_metadata& metadata)
        -> result<uint64_t> = 0;

    [[nodiscard]] virtual auto download(const std::string& key)
        -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto download_range(const std::string& key,
                                              uint64_t offset,
                                              uint64_t length)
        -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto get_object_metadata(const std::string& key)
        -> result<object_metadata> = 0;

    /**
     * @brief List objects whose relative key starts with the prefix
     */
    [[nodiscard]] virtual auto list(const std::string& prefix)
        -> result<std::vector<object_summary>> = 0;

    [[nodiscard]] virtual auto delete_object(const std::string& key)
        -> result<void> = 0;

    [[nodiscard]] virtual auto begin_multipart(const std::string& key,
                                               const object_metadata& metadata)
        -> result<multipart_upload> = 0;

    [[nodiscard]] virtual auto upload_part(const multipart_upload& upload,
                                           uint32_t part_number,
                                           std::span<const std::byte> data)
        -> result<completed_part> = 0;

    /**
     * @brief Publish the object; parts must be sorted by part number
     */
    [[nodiscard]] virtual auto complete_multipart(const multipart_upload& upload,
                                                  const std::vector<completed_part>& parts)
        -> result<void> = 0;

    [[nodiscard]] virtual auto abort_multipart(const multipart_upload& upload)
        -> result<void> = 0;

    /**
     * @brief Whether native multipart is usable with the current credentials
     */
    [[nodiscard]] virtual auto supports_multipart() const -> bool { return true; }
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_H
