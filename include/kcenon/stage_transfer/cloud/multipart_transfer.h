/**
 * @file multipart_transfer.h
 * @brief Part-wise uploads and ranged downloads of large objects
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_MULTIPART_TRANSFER_H
#define KCENON_STAGE_TRANSFER_CLOUD_MULTIPART_TRANSFER_H

#include "kcenon/stage_transfer/cloud/cloud_config.h"
#include "kcenon/stage_transfer/cloud/retry_executor.h"
#include "kcenon/stage_transfer/cloud/storage_client.h"
#include "kcenon/stage_transfer/core/cancellation_token.h"
#include "kcenon/stage_transfer/core/types.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Drives one multipart transfer
 *
 * Up to max_concurrent_parts parts are in flight at once. Each part runs in
 * its own retry scope, so a failing part is retried without resending the
 * completed ones. The first terminal part failure stops the remaining
 * parts; an upload is then aborted and never becomes visible.
 */
class multipart_transfer {
public:
    multipart_transfer(storage_client& client,
                       retry_executor& executor,
                       multipart_config config,
                       std::shared_ptr<cancellation_token> token = nullptr);

    /**
     * @brief Upload a payload with the provider-native multipart protocol
     * @return Bytes stored
     */
    [[nodiscard]] auto upload(const std::string& key,
                              std::span<const std::byte> data,
                              const object_metadata& metadata) -> result<uint64_t>;

    /**
     * @brief Download an object of known size with ranged requests
     */
    [[nodiscard]] auto download(const std::string& key, uint64_t size)
        -> result<byte_buffer>;

    /**
     * @brief Number of parts for a payload size
     */
    [[nodiscard]] static auto part_count(uint64_t size, std::size_t part_size) -> uint32_t;

    [[nodiscard]] auto config() const -> const multipart_config& { return config_; }

private:
    storage_client& client_;
    retry_executor& executor_;
    multipart_config config_;
    std::shared_ptr<cancellation_token> token_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_MULTIPART_TRANSFER_H
