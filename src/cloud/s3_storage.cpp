/**
 * @file s3_storage.cpp
 * @brief S3 storage client implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/s3_storage.h"

#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace kcenon::stage_transfer {

using namespace cloud_utils;

namespace {

constexpr const char* provider_name = "S3";
constexpr const char* metadata_prefix = "x-amz-meta-";
constexpr const char* default_region = "us-east-1";

auto parse_u64(const std::string& text) -> uint64_t {
    uint64_t value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

auto strip_scheme(std::string endpoint) -> std::string {
    const auto pos = endpoint.find("://");
    if (pos != std::string::npos) {
        endpoint = endpoint.substr(pos + 3);
    }
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return endpoint;
}

}  // namespace

// ============================================================================
// Signing
// ============================================================================

auto sign_sigv4(const sigv4_request& request,
                const temporary_keys& keys,
                const std::string& region) -> std::string {
#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
    const std::string date_stamp = request.amz_date.substr(0, 8);

    std::ostringstream canonical_request;
    canonical_request << request.method << "\n";
    canonical_request << request.canonical_uri << "\n";
    canonical_request << request.canonical_query << "\n";

    // Canonical headers (must be sorted)
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [key, value] : request.headers) {
        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        sorted_headers[lower_key] = value;
    }

    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [key, value] : sorted_headers) {
        canonical_request << key << ":" << value << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << key;
        first = false;
    }
    canonical_request << "\n";

    const std::string signed_headers = signed_headers_builder.str();
    canonical_request << signed_headers << "\n";
    canonical_request << request.payload_hash;

    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string credential_scope = date_stamp + "/" + region + "/s3/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << request.amz_date << "\n";
    string_to_sign << credential_scope << "\n";
    string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

    auto k_date = hmac_sha256("AWS4" + keys.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region);
    auto k_service = hmac_sha256(k_region, "s3");
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign.str());

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << keys.access_key_id << "/" << credential_scope << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << bytes_to_hex(signature);

    return auth_header.str();
#else
    (void)request;
    (void)keys;
    (void)region;
    return "";
#endif
}

auto translate_s3_failure(const http_response& response) -> provider_failure {
    provider_failure failure;
    failure.status_code = response.status_code;
    const auto body = response.get_body_string();
    failure.provider_code = extract_xml_element(body, "Code").value_or("");
    failure.provider_message = extract_xml_element(body, "Message").value_or("");
    return failure;
}

// ============================================================================
// Implementation
// ============================================================================

struct s3_storage_client::impl {
    stage_info stage;
    temporary_keys keys;
    std::shared_ptr<http_client_interface> http;
    std::string host;
    std::string region;
    bool path_style = false;

    auto object_path(const std::string& key) const -> std::string {
        std::string path = "/";
        if (path_style) {
            path += url_encode(stage.bucket) + "/";
        }
        path += url_encode(stage.object_key(key), false);
        return path;
    }

    auto bucket_path() const -> std::string {
        return path_style ? "/" + url_encode(stage.bucket) : "/";
    }

    auto send(const std::string& method,
              const std::string& operation,
              const std::string& path,
              const std::map<std::string, std::string>& query,
              http_headers headers,
              std::span<const std::byte> body = {}) const -> result<http_response> {
        sigv4_request request;
        request.method = method;
        request.canonical_uri = path;
        request.canonical_query = build_query_string(query);
        request.payload_hash = bytes_to_hex(sha256_bytes(body));
        request.amz_date = get_iso8601_time();

        headers["host"] = host;
        headers["x-amz-date"] = request.amz_date;
        headers["x-amz-content-sha256"] = request.payload_hash;
        if (!keys.session_token.empty()) {
            headers["x-amz-security-token"] = keys.session_token;
        }
        request.headers = headers;
        headers["Authorization"] = sign_sigv4(request, keys, region);

        std::string url = "https://" + host + path;
        if (!request.canonical_query.empty()) {
            url += "?" + request.canonical_query;
        }

        result<http_response> response = unexpected{error{error_code::internal_error,
            "unsupported method " + method}};
        if (method == "GET") {
            response = http->get(url, {}, headers);
        } else if (method == "PUT") {
            response = http->put(url, std::vector<uint8_t>(
                reinterpret_cast<const uint8_t*>(body.data()),
                reinterpret_cast<const uint8_t*>(body.data()) + body.size()), headers);
        } else if (method == "POST") {
            response = http->post(url, to_string(body), headers);
        } else if (method == "DELETE") {
            response = http->del(url, headers);
        } else if (method == "HEAD") {
            response = http->head(url, headers);
        }

        if (!response) {
            return unexpected{make_transport_error(provider_name, operation, response.error())};
        }
        return response;
    }

    static auto fail(const std::string& operation, const http_response& response) -> unexpected {
        return unexpected{make_provider_error(provider_name, operation,
                                              translate_s3_failure(response))};
    }
};

s3_storage_client::s3_storage_client(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

s3_storage_client::~s3_storage_client() = default;

auto s3_storage_client::create(const stage_info& stage,
                               std::shared_ptr<http_client_interface> http_client)
    -> result<std::shared_ptr<s3_storage_client>> {
#ifndef STAGE_TRANS_ENABLE_ENCRYPTION
    (void)stage;
    (void)http_client;
    return unexpected{error{error_code::feature_unavailable,
        "S3 request signing requires OpenSSL support"}};
#else
    const auto* keys = std::get_if<temporary_keys>(&stage.credentials);
    if (keys == nullptr || keys->access_key_id.empty() || keys->secret_access_key.empty()) {
        return unexpected{error{error_code::credential_resolution_failed,
            "S3 stage requires temporary access keys"}};
    }
    if (!http_client) {
        return unexpected{error{error_code::internal_error, "S3 client requires an HTTP client"}};
    }

    auto state = std::make_unique<impl>();
    state->stage = stage;
    state->keys = *keys;
    state->http = std::move(http_client);
    state->region = stage.region.empty() ? default_region : stage.region;

    if (!stage.endpoint.empty()) {
        state->host = strip_scheme(stage.endpoint);
        state->path_style = true;
    } else if (stage.use_regional_url && !stage.region.empty()) {
        state->host = stage.bucket + ".s3." + stage.region + ".amazonaws.com";
    } else {
        state->host = stage.bucket + ".s3.amazonaws.com";
    }

    ST_LOG_DEBUG(log_category::storage,
        "Created S3 client for bucket " + stage.bucket + " via " + state->host);

    return std::shared_ptr<s3_storage_client>(new s3_storage_client(std::move(state)));
#endif
}

auto s3_storage_client::endpoint_url() const -> std::string {
    return "https://" + impl_->host;
}

// ============================================================================
// Object Operations
// ============================================================================

auto s3_storage_client::upload(const std::string& key,
                               std::span<const std::byte> data,
                               const object_metadata& metadata) -> result<uint64_t> {
    http_headers headers;
    headers["Content-Type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, metadata.user_metadata);

    auto response = impl_->send("PUT", "upload", impl_->object_path(key), {}, headers, data);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("upload", response.value());
    }
    return static_cast<uint64_t>(data.size());
}

auto s3_storage_client::download(const std::string& key) -> result<byte_buffer> {
    auto response = impl_->send("GET", "download", impl_->object_path(key), {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("download", response.value());
    }
    const auto& body = response.value().body;
    return byte_buffer(reinterpret_cast<const std::byte*>(body.data()),
                       reinterpret_cast<const std::byte*>(body.data()) + body.size());
}

auto s3_storage_client::download_range(const std::string& key, uint64_t offset, uint64_t length)
    -> result<byte_buffer> {
    http_headers headers;
    headers["Range"] = "bytes=" + std::to_string(offset) + "-" +
                       std::to_string(offset + length - 1);

    auto response = impl_->send("GET", "download_range", impl_->object_path(key), {}, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("download_range", response.value());
    }
    const auto& body = response.value().body;
    return byte_buffer(reinterpret_cast<const std::byte*>(body.data()),
                       reinterpret_cast<const std::byte*>(body.data()) + body.size());
}

auto s3_storage_client::get_object_metadata(const std::string& key) -> result<object_metadata> {
    auto response = impl_->send("HEAD", "head", impl_->object_path(key), {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        return impl_->fail("head", resp);
    }

    object_metadata metadata;
    metadata.content_length = parse_u64(resp.get_header("Content-Length").value_or("0"));
    metadata.etag = resp.get_header("ETag").value_or("");
    metadata.user_metadata = collect_metadata_headers(resp.headers, metadata_prefix);
    return metadata;
}

auto s3_storage_client::list(const std::string& prefix) -> result<std::vector<object_summary>> {
    std::vector<object_summary> objects;
    std::string continuation;
    const auto& stage_prefix = impl_->stage.prefix;

    while (true) {
        std::map<std::string, std::string> query{
            {"list-type", "2"},
            {"prefix", stage_prefix + prefix},
        };
        if (!continuation.empty()) {
            query["continuation-token"] = continuation;
        }

        auto response = impl_->send("GET", "list", impl_->bucket_path(), query, {});
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return impl_->fail("list", response.value());
        }

        const auto body = response.value().get_body_string();
        for (const auto& block : extract_xml_blocks(body, "Contents")) {
            auto key = extract_xml_element(block, "Key").value_or("");
            if (key.size() <= stage_prefix.size() || key.compare(0, stage_prefix.size(), stage_prefix) != 0) {
                continue;
            }
            objects.push_back({key.substr(stage_prefix.size()),
                               parse_u64(extract_xml_element(block, "Size").value_or("0"))});
        }

        if (extract_xml_element(body, "IsTruncated").value_or("false") != "true") {
            break;
        }
        continuation = extract_xml_element(body, "NextContinuationToken").value_or("");
        if (continuation.empty()) {
            break;
        }
    }

    return objects;
}

auto s3_storage_client::delete_object(const std::string& key) -> result<void> {
    auto response = impl_->send("DELETE", "delete", impl_->object_path(key), {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("delete", response.value());
    }
    return {};
}

// ============================================================================
// Multipart Operations
// ============================================================================

auto s3_storage_client::begin_multipart(const std::string& key, const object_metadata& metadata)
    -> result<multipart_upload> {
    http_headers headers;
    headers["Content-Type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, metadata.user_metadata);

    auto response = impl_->send("POST", "begin_multipart", impl_->object_path(key),
                                {{"uploads", ""}}, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("begin_multipart", response.value());
    }

    auto upload_id = extract_xml_element(response.value().get_body_string(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected{error{error_code::provider_rejected,
            "S3 begin_multipart returned no UploadId"}};
    }
    return multipart_upload{key, *upload_id, metadata};
}

auto s3_storage_client::upload_part(const multipart_upload& upload,
                                    uint32_t part_number,
                                    std::span<const std::byte> data) -> result<completed_part> {
    auto response = impl_->send("PUT", "upload_part", impl_->object_path(upload.key),
                                {{"partNumber", std::to_string(part_number)},
                                 {"uploadId", upload.upload_id}},
                                {}, data);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return impl_->fail("upload_part", response.value());
    }
    return completed_part{part_number, response.value().get_header("ETag").value_or(""),
                          static_cast<uint64_t>(data.size())};
}

auto s3_storage_client::complete_multipart(const multipart_upload& upload,
                                           const std::vector<completed_part>& parts)
    -> result<void> {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        xml << "<Part><PartNumber>" << part.part_number << "</PartNumber>"
            << "<ETag>" << xml_escape(part.etag) << "</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";
    const auto body = xml.str();

    http_headers headers;
    headers["Content-Type"] = "application/xml";
    auto response = impl_->send("POST", "complete_multipart", impl_->object_path(upload.key),
                                {{"uploadId", upload.upload_id}}, headers, as_bytes(body));
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    // A 200 response may still carry an <Error> document
    if (!resp.is_success() || resp.get_body_string().find("<Error>") != std::string::npos) {
        auto failure = translate_s3_failure(resp);
        if (resp.is_success()) {
            failure.status_code = 500;
        }
        return unexpected{make_provider_error(provider_name, "complete_multipart", failure)};
    }
    return {};
}

auto s3_storage_client::abort_multipart(const multipart_upload& upload) -> result<void> {
    auto response = impl_->send("DELETE", "abort_multipart", impl_->object_path(upload.key),
                                {{"uploadId", upload.upload_id}}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success() && response.value().status_code != 404) {
        return impl_->fail("abort_multipart", response.value());
    }
    return {};
}

}  // namespace kcenon::stage_transfer
