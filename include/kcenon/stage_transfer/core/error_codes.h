/**
 * @file error_codes.h
 * @brief Error taxonomy for stage_transfer
 * @version 0.1.0
 *
 * Every error_code belongs to exactly one error_category. The category,
 * not the individual code, drives the retry decision and the way a failure
 * propagates (per-file row vs. whole command).
 *
 * Category ranges:
 * - -100 to -119: Usage
 * - -200 to -219: Credential resolution
 * - -300 to -319: Retryable transport
 * - -320 to -339: Exhausted retries
 * - -400 to -419: Terminal provider
 * - -500 to -519: Local resource
 * - -600 to -619: Data integrity
 * - -900 to -919: Internal
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_STAGE_TRANSFER_CORE_ERROR_CODES_H

#include "types.h"

#include <cerrno>
#include <string>
#include <string_view>

namespace kcenon::stage_transfer {

/**
 * @brief Error categories shared by every storage provider
 */
enum class error_category {
    none,
    usage,
    credential_resolution,
    retryable_transport,
    exhausted_retries,
    terminal_provider,
    local_resource,
    data_integrity,
    internal,
};

[[nodiscard]] constexpr auto to_string(error_category category) noexcept -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::usage: return "usage";
        case error_category::credential_resolution: return "credential_resolution";
        case error_category::retryable_transport: return "retryable_transport";
        case error_category::exhausted_retries: return "exhausted_retries";
        case error_category::terminal_provider: return "terminal_provider";
        case error_category::local_resource: return "local_resource";
        case error_category::data_integrity: return "data_integrity";
        case error_category::internal: return "internal";
        default: return "unknown";
    }
}

/**
 * @brief Map an error code onto its category
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    const auto value = static_cast<int>(code);
    if (value == 0) {
        return error_category::none;
    }
    if (value <= -100 && value >= -119) {
        return error_category::usage;
    }
    if (value <= -200 && value >= -219) {
        return error_category::credential_resolution;
    }
    if (value <= -300 && value >= -319) {
        return error_category::retryable_transport;
    }
    if (value <= -320 && value >= -339) {
        return error_category::exhausted_retries;
    }
    if (value <= -400 && value >= -419) {
        return error_category::terminal_provider;
    }
    if (value <= -500 && value >= -519) {
        return error_category::local_resource;
    }
    if (value <= -600 && value >= -619) {
        return error_category::data_integrity;
    }
    return error_category::internal;
}

/**
 * @brief Check if the error may succeed when the operation is repeated
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return category_of(code) == error_category::retryable_transport;
}

[[nodiscard]] constexpr auto is_usage_error(error_code code) noexcept -> bool {
    return category_of(code) == error_category::usage;
}

[[nodiscard]] constexpr auto is_local_resource_error(error_code code) noexcept -> bool {
    return category_of(code) == error_category::local_resource;
}

[[nodiscard]] constexpr auto is_data_integrity_error(error_code code) noexcept -> bool {
    return category_of(code) == error_category::data_integrity;
}

/**
 * @brief Errors that abort the whole command instead of a single file
 */
[[nodiscard]] constexpr auto is_command_level_error(error_code code) noexcept -> bool {
    const auto category = category_of(code);
    return category == error_category::usage ||
           category == error_category::credential_resolution;
}

/**
 * @brief Classify an errno value raised by local filesystem I/O
 */
[[nodiscard]] constexpr auto classify_local_io_error(int errnum) noexcept -> error_code {
    switch (errnum) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return error_code::no_space_left;
        case EACCES:
        case EPERM:
        case EROFS:
            return error_code::local_permission_denied;
        case ENOENT:
        case ENOTDIR:
            return error_code::local_file_not_found;
        default:
            return error_code::local_io_error;
    }
}

/**
 * @brief Detect the no-space-left condition in an I/O failure message
 *
 * Storage SDKs and stream wrappers frequently only surface the text of the
 * underlying failure.
 */
[[nodiscard]] inline auto mentions_no_space_left(std::string_view message) -> bool {
    return message.find("No space left on device") != std::string_view::npos ||
           message.find("no space left on device") != std::string_view::npos;
}

/**
 * @brief Build an error with the category prefixed to the message
 */
[[nodiscard]] inline auto describe(const error& err) -> std::string {
    std::string text(to_string(category_of(err.code)));
    text += ": ";
    text += err.message.empty() ? to_string(err.code) : err.message;
    return text;
}

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_ERROR_CODES_H
