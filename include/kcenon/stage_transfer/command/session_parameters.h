/**
 * @file session_parameters.h
 * @brief Session-level transfer defaults negotiated with the server
 */

#ifndef KCENON_STAGE_TRANSFER_COMMAND_SESSION_PARAMETERS_H
#define KCENON_STAGE_TRANSFER_COMMAND_SESSION_PARAMETERS_H

#include <kcenon/stage_transfer/core/transfer_types.h>
#include <kcenon/stage_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::stage_transfer {

/**
 * @brief Session defaults used when a command does not override them
 *
 * A command never mutates these values. Per-command overrides live only in
 * the transfer_intent built from them.
 */
struct session_parameters {
    uint64_t big_file_threshold = transfer_options::default_threshold;
    std::size_t parallel = 4;
    std::size_t max_retries = 25;
    bool gcs_use_downscoped_credential = false;
    bool use_regional_url = false;
    std::chrono::milliseconds network_timeout{300000};

    /**
     * @brief Apply a driver parameter by name (case-insensitive)
     *
     * Recognized names: GCS_USE_DOWNSCOPED_CREDENTIAL, BIG_FILE_THRESHOLD,
     * PARALLEL, MAX_RETRIES, USE_REGIONAL_URL, NETWORK_TIMEOUT_MS.
     * @return invalid_parameter for an unknown name or malformed value
     */
    [[nodiscard]] auto apply(std::string_view name, std::string_view value) -> result<void>;

    /**
     * @brief Default options for a new command
     */
    [[nodiscard]] auto default_options() const -> transfer_options;
};

/**
 * @brief Parse a boolean option value (true/false, on/off, yes/no, 1/0)
 */
[[nodiscard]] auto parse_bool_value(std::string_view value) -> std::optional<bool>;

/**
 * @brief Parse a signed decimal integer, rejecting trailing characters
 */
[[nodiscard]] auto parse_integer_value(std::string_view value) -> std::optional<int64_t>;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_COMMAND_SESSION_PARAMETERS_H
