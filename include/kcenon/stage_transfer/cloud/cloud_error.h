/**
 * @file cloud_error.h
 * @brief Translation of provider failures into the shared error taxonomy
 * @version 0.1.0
 *
 * Each provider extracts its native error code (S3 and GCS from the XML
 * body, Azure from the x-ms-error-code header) and hands it to
 * classify_http_failure() together with the HTTP status.
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_CLOUD_ERROR_H
#define KCENON_STAGE_TRANSFER_CLOUD_CLOUD_ERROR_H

#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/types.h"

#include <string>
#include <string_view>

namespace kcenon::stage_transfer {

/**
 * @brief Native failure reported by a provider
 */
struct provider_failure {
    int status_code = 0;
    /// Provider error code, e.g. "SlowDown", "ExpiredToken", "AuthenticationFailed"
    std::string provider_code;
    /// Provider error message, if any
    std::string provider_message;
};

/**
 * @brief Classify a provider failure
 *
 * - 408, 429 and throttling codes: throttled or transient_network
 * - expired token codes, and 401: token_expired
 * - 403: access_denied
 * - 404: object_not_found
 * - 500, 502, 503, 504: provider_unavailable (503 SlowDown: throttled)
 * - any other status: provider_rejected
 */
[[nodiscard]] inline auto classify_http_failure(const provider_failure& failure)
    -> error_code {
    const auto& code = failure.provider_code;

    if (code == "SlowDown" || code == "Throttling" || code == "ServerBusy" ||
        code == "TooManyRequests" || code == "RequestLimitExceeded" ||
        failure.status_code == 429) {
        return error_code::throttled;
    }
    if (code == "RequestTimeout" || code == "OperationTimedOut" ||
        failure.status_code == 408) {
        return error_code::transient_network;
    }
    if (code == "ExpiredToken" || code == "TokenRefreshRequired" ||
        failure.status_code == 401 ||
        (code == "AuthenticationFailed" &&
         failure.provider_message.find("expir") != std::string::npos)) {
        return error_code::token_expired;
    }

    switch (failure.status_code) {
        case 403:
            return error_code::access_denied;
        case 404:
            return error_code::object_not_found;
        case 500:
        case 502:
        case 503:
        case 504:
            return error_code::provider_unavailable;
        default:
            return error_code::provider_rejected;
    }
}

/**
 * @brief Build the error for a provider failure
 */
[[nodiscard]] inline auto make_provider_error(std::string_view provider,
                                              std::string_view operation,
                                              const provider_failure& failure) -> error {
    std::string message(provider);
    message += " ";
    message += operation;
    message += " failed with HTTP ";
    message += std::to_string(failure.status_code);
    if (!failure.provider_code.empty()) {
        message += " (";
        message += failure.provider_code;
        message += ")";
    }
    if (!failure.provider_message.empty()) {
        message += ": ";
        message += failure.provider_message;
    }
    return error{classify_http_failure(failure), std::move(message)};
}

/**
 * @brief Translate a request that produced no HTTP response
 *
 * The message is kept so that a local "No space left on device" surfacing
 * through a streaming sink is still classified as a local resource error.
 */
[[nodiscard]] inline auto make_transport_error(std::string_view provider,
                                               std::string_view operation,
                                               const error& cause) -> error {
    std::string message(provider);
    message += " ";
    message += operation;
    message += ": ";
    message += cause.message;

    if (mentions_no_space_left(cause.message)) {
        return error{error_code::no_space_left, std::move(message)};
    }
    if (cause.code == error_code::feature_unavailable) {
        return error{error_code::feature_unavailable, std::move(message)};
    }
    return error{error_code::transient_network, std::move(message)};
}

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_CLOUD_ERROR_H
