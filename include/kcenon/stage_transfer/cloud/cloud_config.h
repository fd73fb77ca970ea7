/**
 * @file cloud_config.h
 * @brief Runtime configuration for storage clients
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_CLOUD_CONFIG_H
#define KCENON_STAGE_TRANSFER_CLOUD_CLOUD_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kcenon::stage_transfer {

/**
 * @brief Retry policy for storage operations
 */
struct retry_policy {
    /// Retries allowed after the first attempt
    std::size_t max_retries = 25;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{16000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = true;

    /// Credential refreshes allowed per operation on token_expired
    std::size_t max_token_refreshes = 3;

    /**
     * @brief Policy without delays, used by tests and local stages
     */
    [[nodiscard]] static auto immediate(std::size_t retries) -> retry_policy {
        retry_policy policy;
        policy.max_retries = retries;
        policy.initial_delay = std::chrono::milliseconds(0);
        policy.max_delay = std::chrono::milliseconds(0);
        policy.use_jitter = false;
        return policy;
    }
};

/**
 * @brief Multipart transfer configuration
 */
struct multipart_config {
    static constexpr std::size_t min_part_size = 5 * 1024 * 1024;

    /// Size of each part (the last part may be smaller)
    std::size_t part_size = 8 * 1024 * 1024;

    /// Parts in flight at once for one file
    std::size_t max_concurrent_parts = 4;
};

/**
 * @brief Options applied to every storage client of one command
 */
struct storage_client_options {
    retry_policy retry;
    multipart_config multipart;
    std::chrono::milliseconds request_timeout{300000};
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_CLOUD_CONFIG_H
