/**
 * @file cloud_utils.h
 * @brief Common utility functions for storage provider implementations
 * @version 0.1.0
 *
 * Shared helpers used by the S3, GCS and Azure clients and by the
 * credential resolver.
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_CLOUD_UTILS_H
#define KCENON_STAGE_TRANSFER_CLOUD_CLOUD_UTILS_H

#include "cloud_config.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hexadecimal string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 decode string
 * @return Decoded bytes, or nullopt when the input holds characters outside
 *         the base64 alphabet
 */
auto base64_decode(const std::string& encoded) -> std::optional<std::vector<uint8_t>>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Build a query string with sorted, URL encoded parameters
 *
 * Parameters with an empty value are emitted as "name=" so the result is
 * also the canonical query string of a SigV4 request.
 */
auto build_query_string(const std::map<std::string, std::string>& params) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 hash of a string
 * @return 32 hash bytes, or zeros if encryption is disabled
 */
auto sha256(const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief SHA256 hash of bytes
 * @return 32 hash bytes, or zeros if encryption is disabled
 */
auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256
 * @return 32 MAC bytes, or zeros if encryption is disabled
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Current UTC time as YYYYMMDD'T'HHMMSS'Z'
 */
auto get_iso8601_time() -> std::string;

/**
 * @brief Current UTC time in RFC 1123 format
 */
auto get_rfc1123_time() -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract the first XML element value
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract every occurrence of an element, including its tags
 */
auto extract_xml_blocks(const std::string& xml,
                        const std::string& tag) -> std::vector<std::string>;

/**
 * @brief Escape text for inclusion in an XML element
 */
auto xml_escape(const std::string& text) -> std::string;

/**
 * @brief Decode the five predefined XML entities
 */
auto xml_unescape(const std::string& text) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Extract JSON value (simple parser for a known structure)
 *
 * String values are returned unescaped. A JSON null yields nullopt.
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

/**
 * @brief Extract a JSON object value including its braces
 */
auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string>;

/**
 * @brief Extract an array of JSON strings
 * @return The strings, or nullopt when the key is absent or not an array
 */
auto extract_json_string_array(const std::string& json,
                               const std::string& key)
    -> std::optional<std::vector<std::string>>;

// ============================================================================
// Metadata Header Utilities
// ============================================================================

/**
 * @brief Add user metadata as prefixed headers (x-amz-meta-, x-goog-meta-, x-ms-meta-)
 */
void apply_metadata_headers(std::map<std::string, std::string>& headers,
                            const std::string& prefix,
                            const std::map<std::string, std::string>& metadata);

/**
 * @brief Collect prefixed response headers as user metadata
 * @return Map with lower-cased keys and the prefix removed
 */
auto collect_metadata_headers(const std::map<std::string, std::string>& headers,
                              const std::string& prefix)
    -> std::map<std::string, std::string>;

// ============================================================================
// Retry Policy Utilities
// ============================================================================

/**
 * @brief Calculate delay with exponential backoff and jitter
 * @param policy Retry policy configuration
 * @param retry Retry number (1-based)
 */
auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t retry) -> std::chrono::milliseconds;

}  // namespace kcenon::stage_transfer::cloud_utils

#endif  // KCENON_STAGE_TRANSFER_CLOUD_CLOUD_UTILS_H
