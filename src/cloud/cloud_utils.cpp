/**
 * @file cloud_utils.cpp
 * @brief Common utility functions for storage provider implementations
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/cloud_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <string_view>
#include <utility>

#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#endif

namespace kcenon::stage_transfer::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr std::string_view base64_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_value(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}
}  // namespace

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        hex += hex_digits[byte >> 4];
        hex += hex_digits[byte & 0x0F];
    }
    return hex;
}

auto base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    std::size_t offset = 0;
    for (; offset + 3 <= data.size(); offset += 3) {
        const uint32_t group = (uint32_t{data[offset]} << 16) |
                               (uint32_t{data[offset + 1]} << 8) |
                               uint32_t{data[offset + 2]};
        for (int shift = 18; shift >= 0; shift -= 6) {
            encoded += base64_alphabet[(group >> shift) & 0x3F];
        }
    }

    const auto tail = data.size() - offset;
    if (tail > 0) {
        uint32_t group = uint32_t{data[offset]} << 16;
        if (tail == 2) {
            group |= uint32_t{data[offset + 1]} << 8;
        }
        encoded += base64_alphabet[(group >> 18) & 0x3F];
        encoded += base64_alphabet[(group >> 12) & 0x3F];
        encoded += tail == 2 ? base64_alphabet[(group >> 6) & 0x3F] : '=';
        encoded += '=';
    }
    return encoded;
}

auto base64_encode(const std::string& data) -> std::string {
    return base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

auto base64_decode(const std::string& encoded) -> std::optional<std::vector<uint8_t>> {
    std::vector<uint8_t> decoded;
    decoded.reserve(encoded.size() / 4 * 3);

    uint32_t bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        const int val = base64_value(c);
        if (val < 0) {
            return std::nullopt;
        }

        bits = (bits << 6) | static_cast<uint32_t>(val);
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            decoded.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return decoded;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    constexpr std::string_view upper_hex = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(value.size());

    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        const bool unreserved = std::isalnum(byte) || c == '-' || c == '_' ||
                                c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            escaped += c;
            continue;
        }
        escaped += '%';
        escaped += upper_hex[byte >> 4];
        escaped += upper_hex[byte & 0x0F];
    }
    return escaped;
}

auto build_query_string(const std::map<std::string, std::string>& params) -> std::string {
    std::map<std::string, std::string> encoded;
    for (const auto& [name, value] : params) {
        encoded[url_encode(name)] = url_encode(value);
    }

    std::string query;
    for (const auto& [name, value] : encoded) {
        if (!query.empty()) {
            query += '&';
        }
        query += name;
        query += '=';
        query += value;
    }
    return query;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    return sha256_bytes(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data.data()), data.size()));
}

auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t> {
#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
#else
    (void)data;
    return std::vector<uint8_t>(32, 0);
#endif
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
#else
    (void)key;
    (void)data;
    return std::vector<uint8_t>(32, 0);
#endif
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {
auto format_utc_now(const char* pattern) -> std::string {
    const auto seconds = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, pattern);
    return out.str();
}
}  // namespace

auto get_iso8601_time() -> std::string {
    return format_utc_now("%Y%m%dT%H%M%SZ");
}

auto get_rfc1123_time() -> std::string {
    return format_utc_now("%a, %d %b %Y %H:%M:%S GMT");
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    const auto opening = xml.find("<" + tag + ">");
    if (opening == std::string::npos) {
        return std::nullopt;
    }
    const auto content = opening + tag.size() + 2;
    const auto closing = xml.find("</" + tag + ">", content);
    if (closing == std::string::npos) {
        return std::nullopt;
    }
    return xml_unescape(xml.substr(content, closing - content));
}

auto extract_xml_blocks(const std::string& xml,
                        const std::string& tag) -> std::vector<std::string> {
    std::vector<std::string> blocks;
    const std::string open_tag = "<" + tag + ">";
    const std::string close_tag = "</" + tag + ">";

    std::size_t pos = 0;
    while (true) {
        auto start = xml.find(open_tag, pos);
        if (start == std::string::npos) {
            break;
        }
        auto end = xml.find(close_tag, start + open_tag.size());
        if (end == std::string::npos) {
            break;
        }
        end += close_tag.size();
        blocks.push_back(xml.substr(start, end - start));
        pos = end;
    }
    return blocks;
}

auto xml_escape(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

auto xml_unescape(const std::string& text) -> std::string {
    if (text.find('&') == std::string::npos) {
        return text;
    }
    static const std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                if (text.compare(i, entity.size(), entity) == 0) {
                    out += ch;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

// ============================================================================
// JSON Utilities
// ============================================================================

namespace {
auto find_json_value_start(const std::string& json,
                           const std::string& key) -> std::size_t {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::string::npos;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::string::npos;
    }

    return json.find_first_not_of(" \t\n\r", pos + 1);
}
}  // namespace

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    auto pos = find_json_value_start(json, key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        std::string value;
        for (auto i = pos + 1; i < json.size(); ++i) {
            const char c = json[i];
            if (c == '"') {
                return value;
            }
            if (c == '\\' && i + 1 < json.size()) {
                const char next = json[++i];
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case 'u':
                        if (i + 4 < json.size()) {
                            unsigned int code = 0;
                            const char* first = json.data() + i + 1;
                            auto [ptr, ec] = std::from_chars(first, first + 4, code, 16);
                            if (ec == std::errc{} && ptr == first + 4 && code < 0x80) {
                                value += static_cast<char>(code);
                            }
                            i += 4;
                        }
                        break;
                    default: value += next;
                }
                continue;
            }
            value += c;
        }
        return std::nullopt;
    }

    auto end_pos = json.find_first_of(",}\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto raw = json.substr(pos, end_pos - pos);
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) {
        raw.pop_back();
    }
    if (raw == "null") {
        return std::nullopt;
    }
    return raw;
}

auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string> {
    auto pos = find_json_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    bool in_string = false;
    for (auto i = pos; i < json.size(); ++i) {
        const char c = json[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return json.substr(pos, i - pos + 1);
            }
        }
    }
    return std::nullopt;
}

auto extract_json_string_array(const std::string& json,
                               const std::string& key)
    -> std::optional<std::vector<std::string>> {
    auto pos = find_json_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '[') {
        return std::nullopt;
    }

    std::vector<std::string> values;
    std::string current;
    bool in_string = false;
    for (auto i = pos + 1; i < json.size(); ++i) {
        const char c = json[i];
        if (in_string) {
            if (c == '\\' && i + 1 < json.size()) {
                current += json[++i];
            } else if (c == '"') {
                values.push_back(std::move(current));
                current.clear();
                in_string = false;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == ']') {
            return values;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Metadata Header Utilities
// ============================================================================

namespace {
auto lower_case(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
}  // namespace

void apply_metadata_headers(std::map<std::string, std::string>& headers,
                            const std::string& prefix,
                            const std::map<std::string, std::string>& metadata) {
    for (const auto& [key, value] : metadata) {
        headers[prefix + key] = value;
    }
}

auto collect_metadata_headers(const std::map<std::string, std::string>& headers,
                              const std::string& prefix)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> metadata;
    const auto lower_prefix = lower_case(prefix);
    for (const auto& [name, value] : headers) {
        auto lower_name = lower_case(name);
        if (lower_name.size() > lower_prefix.size() &&
            lower_name.compare(0, lower_prefix.size(), lower_prefix) == 0) {
            metadata[lower_name.substr(lower_prefix.size())] = value;
        }
    }
    return metadata;
}

// ============================================================================
// Retry Policy Utilities
// ============================================================================

auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t retry) -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < retry; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::stage_transfer::cloud_utils
