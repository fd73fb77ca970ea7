/**
 * @file renewable_storage_client.h
 * @brief Storage client whose credentials can be replaced while in use
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_RENEWABLE_STORAGE_CLIENT_H
#define KCENON_STAGE_TRANSFER_CLOUD_RENEWABLE_STORAGE_CLIENT_H

#include "kcenon/stage_transfer/cloud/storage_client.h"

#include <cstddef>
#include <memory>
#include <mutex>

namespace kcenon::stage_transfer {

/**
 * @brief Forwards every call to the client built from the latest credentials
 *
 * The transfer agent renews the inner client after re-resolving a stage
 * whose token expired. Calls already running finish on the client they
 * started with; the next call uses the renewed one. Multipart handles stay
 * valid across a renewal because the stage location is unchanged.
 *
 * @note Thread-safe: renew() may run while other threads issue requests.
 */
class renewable_storage_client : public storage_client {
public:
    explicit renewable_storage_client(std::shared_ptr<storage_client> initial);

    /**
     * @brief Replace the client used by subsequent calls
     */
    void renew(std::shared_ptr<storage_client> renewed);

    /**
     * @brief Number of renew() calls so far
     */
    [[nodiscard]] auto generation() const -> std::size_t;

    [[nodiscard]] auto current() const -> std::shared_ptr<storage_client>;

    [[nodiscard]] auto provider() const -> provider_kind override;

    [[nodiscard]] auto upload(const std::string& key,
                              std::span<const std::byte> data,
                              const object_metadata& metadata) -> result<uint64_t> override;

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

private:
    mutable std::mutex mutex_;
    std::shared_ptr<storage_client> client_;
    std::size_t generation_ = 0;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_RENEWABLE_STORAGE_CLIENT_H
