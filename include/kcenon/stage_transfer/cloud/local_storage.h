/**
 * @file local_storage.h
 * @brief Storage client for stages backed by a local directory
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_LOCAL_STORAGE_H
#define KCENON_STAGE_TRANSFER_CLOUD_LOCAL_STORAGE_H

#include "stage_info.h"
#include "storage_client.h"

#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Storage client for LOCAL_FS stages
 *
 * Objects are files under <bucket>/<prefix>. User metadata lives in a
 * sidecar file "<object>.st_meta" holding one "key=value" line per entry;
 * sidecars and in-flight temporary files are never listed. Every object is
 * published with an atomic rename.
 *
 * Multipart parts are buffered in memory until complete_multipart().
 *
 * @note This client is thread-safe for concurrent operations.
 */
class local_storage_client : public storage_client {
public:
    static constexpr const char* metadata_suffix = ".st_meta";

    [[nodiscard]] static auto create(const stage_info& stage)
        -> result<std::shared_ptr<local_storage_client>>;

    ~local_storage_client() override;

    local_storage_client(const local_storage_client&) = delete;
    auto operator=(const local_storage_client&) -> local_storage_client& = delete;

    [[nodiscard]] auto provider() const -> provider_kind override {
        return provider_kind::local_fs;
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
     * @brief Filesystem path of an object
     */
    [[nodiscard]] auto object_path(const std::string& key) const -> std::filesystem::path;

private:
    struct impl;
    explicit local_storage_client(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_LOCAL_STORAGE_H
