/**
 * @file types.h
 * @brief Core type definitions for stage_transfer
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_TYPES_H
#define KCENON_STAGE_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Error codes for stage transfer operations
 *
 * Codes are grouped in ranges, one range per error category
 * (see error_codes.h for the category mapping).
 */
enum class error_code {
    success = 0,

    // Usage errors (-100 to -119)
    invalid_command = -100,
    invalid_parameter = -101,
    unsupported_operation = -102,
    metadata_already_consumed = -103,

    // Credential resolution errors (-200 to -219)
    credential_resolution_failed = -200,
    stage_not_found = -201,
    session_expired = -202,
    stage_access_denied = -203,
    invalid_stage_descriptor = -204,

    // Retryable transport errors (-300 to -319)
    throttled = -300,
    transient_network = -301,
    token_expired = -302,
    provider_unavailable = -303,

    // Retry budget exhausted (-320 to -339)
    retries_exhausted = -320,

    // Terminal provider errors (-400 to -419)
    access_denied = -400,
    object_not_found = -401,
    provider_rejected = -402,

    // Local resource errors (-500 to -519)
    no_space_left = -500,
    local_permission_denied = -501,
    local_file_not_found = -502,
    local_io_error = -503,

    // Data integrity errors (-600 to -619)
    digest_mismatch = -600,
    decryption_failed = -601,
    corrupted_payload = -602,

    // Internal errors (-900 to -919)
    cancelled = -900,
    transfer_failed = -901,
    internal_error = -902,
    feature_unavailable = -903,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_command:
            return "invalid command";
        case error_code::invalid_parameter:
            return "invalid parameter";
        case error_code::unsupported_operation:
            return "unsupported operation";
        case error_code::metadata_already_consumed:
            return "file transfer metadata already consumed";
        case error_code::credential_resolution_failed:
            return "credential resolution failed";
        case error_code::stage_not_found:
            return "stage not found";
        case error_code::session_expired:
            return "session expired";
        case error_code::stage_access_denied:
            return "stage access denied";
        case error_code::invalid_stage_descriptor:
            return "invalid stage descriptor";
        case error_code::throttled:
            return "request throttled";
        case error_code::transient_network:
            return "transient network failure";
        case error_code::token_expired:
            return "storage token expired";
        case error_code::provider_unavailable:
            return "storage provider unavailable";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::access_denied:
            return "access denied";
        case error_code::object_not_found:
            return "object not found";
        case error_code::provider_rejected:
            return "request rejected by storage provider";
        case error_code::no_space_left:
            return "no space left on device";
        case error_code::local_permission_denied:
            return "local permission denied";
        case error_code::local_file_not_found:
            return "local file not found";
        case error_code::local_io_error:
            return "local I/O error";
        case error_code::digest_mismatch:
            return "digest mismatch";
        case error_code::decryption_failed:
            return "decryption failed";
        case error_code::corrupted_payload:
            return "corrupted payload";
        case error_code::cancelled:
            return "transfer cancelled";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::feature_unavailable:
            return "feature unavailable";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Byte buffer used for payloads
 */
using byte_buffer = std::vector<std::byte>;

/**
 * @brief View a string's characters as bytes
 */
[[nodiscard]] inline auto as_bytes(std::string_view text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

/**
 * @brief Copy a byte span into a string
 */
[[nodiscard]] inline auto to_string(std::span<const std::byte> data) -> std::string {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

/**
 * @brief Copy a string into a byte buffer
 */
[[nodiscard]] inline auto to_buffer(std::string_view text) -> byte_buffer {
    auto bytes = as_bytes(text);
    return byte_buffer(bytes.begin(), bytes.end());
}

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_TYPES_H
