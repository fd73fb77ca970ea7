/**
 * @file gcs_storage.cpp
 * @brief Google Cloud Storage client implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/gcs_storage.h"

#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <charconv>
#include <sstream>

namespace kcenon::stage_transfer {

using namespace cloud_utils;

namespace {

constexpr const char* provider_name = "GCS";
constexpr const char* metadata_prefix = "x-goog-meta-";

auto parse_u64(const std::string& text) -> uint64_t {
    uint64_t value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

auto to_byte_buffer(const std::vector<uint8_t>& body) -> byte_buffer {
    return byte_buffer(reinterpret_cast<const std::byte*>(body.data()),
                       reinterpret_cast<const std::byte*>(body.data()) + body.size());
}

auto to_body(std::span<const std::byte> data) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                reinterpret_cast<const uint8_t*>(data.data()) + data.size());
}

}  // namespace

auto translate_gcs_failure(const http_response& response) -> provider_failure {
    provider_failure failure;
    failure.status_code = response.status_code;
    const auto body = response.get_body_string();
    failure.provider_code = extract_xml_element(body, "Code").value_or("");
    failure.provider_message = extract_xml_element(body, "Message").value_or(
        extract_xml_element(body, "Details").value_or(""));
    return failure;
}

// ============================================================================
// Implementation
// ============================================================================

struct gcs_storage_client::impl {
    stage_info stage;
    std::shared_ptr<http_client_interface> http;
    std::string base_url;
    std::string bearer_token;
    std::string presigned;

    [[nodiscard]] auto is_presigned() const -> bool { return !presigned.empty(); }

    auto object_url(const std::string& key) const -> std::string {
        if (is_presigned()) {
            return presigned;
        }
        return base_url + "/" + url_encode(stage.object_key(key), false);
    }

    auto with_auth(http_headers headers) const -> http_headers {
        if (!bearer_token.empty()) {
            headers["Authorization"] = "Bearer " + bearer_token;
        }
        return headers;
    }

    static auto fail(const std::string& operation, const http_response& response) -> unexpected {
        return unexpected{make_provider_error(provider_name, operation,
                                              translate_gcs_failure(response))};
    }

    auto check(const std::string& operation, result<http_response> response) const
        -> result<http_response> {
        if (!response) {
            return unexpected{make_transport_error(provider_name, operation, response.error())};
        }
        if (!response.value().is_success()) {
            return fail(operation, response.value());
        }
        return response;
    }

    auto token_mode_only(const std::string& operation) const -> result<void> {
        if (is_presigned()) {
            return unexpected{error{error_code::provider_rejected,
                "GCS " + operation + " is not available with a presigned URL"}};
        }
        return {};
    }
};

gcs_storage_client::gcs_storage_client(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

gcs_storage_client::~gcs_storage_client() = default;

auto gcs_storage_client::create(const stage_info& stage,
                                std::shared_ptr<http_client_interface> http_client)
    -> result<std::shared_ptr<gcs_storage_client>> {
    if (!http_client) {
        return unexpected{error{error_code::internal_error, "GCS client requires an HTTP client"}};
    }

    auto state = std::make_unique<impl>();
    state->stage = stage;
    state->http = std::move(http_client);

    if (const auto* url = std::get_if<presigned_url>(&stage.credentials)) {
        if (url->url.empty()) {
            return unexpected{error{error_code::credential_resolution_failed,
                "GCS presigned URL is empty"}};
        }
        state->presigned = url->url;
    } else if (const auto* token = std::get_if<downscoped_token>(&stage.credentials)) {
        if (token->token.empty()) {
            return unexpected{error{error_code::credential_resolution_failed,
                "GCS access token is empty"}};
        }
        state->bearer_token = token->token;
    } else {
        return unexpected{error{error_code::credential_resolution_failed,
            "GCS stage requires an access token or a presigned URL"}};
    }

    std::string host;
    if (!stage.endpoint.empty()) {
        host = stage.endpoint;
        if (host.find("://") == std::string::npos) {
            host = "https://" + host;
        }
        while (!host.empty() && host.back() == '/') {
            host.pop_back();
        }
    } else if (stage.use_regional_url && !stage.region.empty()) {
        host = "https://storage." + stage.region + ".rep.googleapis.com";
    } else {
        host = "https://storage.googleapis.com";
    }
    state->base_url = host + "/" + url_encode(stage.bucket);

    ST_LOG_DEBUG(log_category::storage,
        std::string("Created GCS client (") +
        (state->is_presigned() ? "presigned URL" : "access token") + ") for " + stage.bucket);

    return std::shared_ptr<gcs_storage_client>(new gcs_storage_client(std::move(state)));
}

auto gcs_storage_client::endpoint_url() const -> std::string {
    return impl_->is_presigned() ? impl_->presigned : impl_->base_url;
}

auto gcs_storage_client::supports_multipart() const -> bool {
    return !impl_->is_presigned();
}

// ============================================================================
// Object Operations
// ============================================================================

auto gcs_storage_client::upload(const std::string& key,
                                std::span<const std::byte> data,
                                const object_metadata& metadata) -> result<uint64_t> {
    http_headers headers;
    headers["Content-Type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, metadata.user_metadata);

    auto response = impl_->check("upload",
        impl_->http->put(impl_->object_url(key), to_body(data), impl_->with_auth(headers)));
    if (!response) {
        return unexpected{response.error()};
    }
    return static_cast<uint64_t>(data.size());
}

auto gcs_storage_client::download(const std::string& key) -> result<byte_buffer> {
    auto response = impl_->check("download",
        impl_->http->get(impl_->object_url(key), {}, impl_->with_auth({})));
    if (!response) {
        return unexpected{response.error()};
    }
    return to_byte_buffer(response.value().body);
}

auto gcs_storage_client::download_range(const std::string& key, uint64_t offset, uint64_t length)
    -> result<byte_buffer> {
    http_headers headers;
    headers["Range"] = "bytes=" + std::to_string(offset) + "-" +
                       std::to_string(offset + length - 1);

    auto response = impl_->check("download_range",
        impl_->http->get(impl_->object_url(key), {}, impl_->with_auth(headers)));
    if (!response) {
        return unexpected{response.error()};
    }
    return to_byte_buffer(response.value().body);
}

auto gcs_storage_client::get_object_metadata(const std::string& key) -> result<object_metadata> {
    auto response = impl_->check("head",
        impl_->http->head(impl_->object_url(key), impl_->with_auth({})));
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    object_metadata metadata;
    metadata.content_length = parse_u64(resp.get_header("Content-Length").value_or("0"));
    metadata.etag = resp.get_header("ETag").value_or("");
    metadata.user_metadata = collect_metadata_headers(resp.headers, metadata_prefix);
    return metadata;
}

auto gcs_storage_client::list(const std::string& prefix) -> result<std::vector<object_summary>> {
    if (auto allowed = impl_->token_mode_only("list"); !allowed) {
        return unexpected{allowed.error()};
    }

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

        auto response = impl_->check("list",
            impl_->http->get(impl_->base_url + "?" + build_query_string(query), {},
                             impl_->with_auth({})));
        if (!response) {
            return unexpected{response.error()};
        }

        const auto body = response.value().get_body_string();
        for (const auto& block : extract_xml_blocks(body, "Contents")) {
            auto key = extract_xml_element(block, "Key").value_or("");
            if (key.size() <= stage_prefix.size() ||
                key.compare(0, stage_prefix.size(), stage_prefix) != 0) {
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

auto gcs_storage_client::delete_object(const std::string& key) -> result<void> {
    if (auto allowed = impl_->token_mode_only("delete"); !allowed) {
        return allowed;
    }
    auto response = impl_->check("delete",
        impl_->http->del(impl_->object_url(key), impl_->with_auth({})));
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

// ============================================================================
// Multipart Operations (XML API)
// ============================================================================

auto gcs_storage_client::begin_multipart(const std::string& key, const object_metadata& metadata)
    -> result<multipart_upload> {
    if (auto allowed = impl_->token_mode_only("multipart upload"); !allowed) {
        return unexpected{allowed.error()};
    }

    http_headers headers;
    headers["Content-Type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, metadata.user_metadata);

    auto response = impl_->check("begin_multipart",
        impl_->http->post(impl_->object_url(key) + "?uploads", "", impl_->with_auth(headers)));
    if (!response) {
        return unexpected{response.error()};
    }

    auto upload_id = extract_xml_element(response.value().get_body_string(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected{error{error_code::provider_rejected,
            "GCS begin_multipart returned no UploadId"}};
    }
    return multipart_upload{key, *upload_id, metadata};
}

auto gcs_storage_client::upload_part(const multipart_upload& upload,
                                     uint32_t part_number,
                                     std::span<const std::byte> data) -> result<completed_part> {
    const auto url = impl_->object_url(upload.key) + "?" + build_query_string({
        {"partNumber", std::to_string(part_number)},
        {"uploadId", upload.upload_id},
    });

    auto response = impl_->check("upload_part",
        impl_->http->put(url, to_body(data), impl_->with_auth({})));
    if (!response) {
        return unexpected{response.error()};
    }
    return completed_part{part_number, response.value().get_header("ETag").value_or(""),
                          static_cast<uint64_t>(data.size())};
}

auto gcs_storage_client::complete_multipart(const multipart_upload& upload,
                                            const std::vector<completed_part>& parts)
    -> result<void> {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        xml << "<Part><PartNumber>" << part.part_number << "</PartNumber>"
            << "<ETag>" << xml_escape(part.etag) << "</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";

    http_headers headers;
    headers["Content-Type"] = "application/xml";
    const auto url = impl_->object_url(upload.key) + "?" +
                     build_query_string({{"uploadId", upload.upload_id}});

    auto response = impl_->check("complete_multipart",
        impl_->http->post(url, xml.str(), impl_->with_auth(headers)));
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto gcs_storage_client::abort_multipart(const multipart_upload& upload) -> result<void> {
    const auto url = impl_->object_url(upload.key) + "?" +
                     build_query_string({{"uploadId", upload.upload_id}});

    auto response = impl_->http->del(url, impl_->with_auth({}));
    if (!response) {
        return unexpected{make_transport_error(provider_name, "abort_multipart", response.error())};
    }
    if (!response.value().is_success() && response.value().status_code != 404) {
        return impl_->fail("abort_multipart", response.value());
    }
    return {};
}

}  // namespace kcenon::stage_transfer
