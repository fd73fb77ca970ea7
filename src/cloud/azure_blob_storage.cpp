/**
 * @file azure_blob_storage.cpp
 * @brief Azure Blob Storage client implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/azure_blob_storage.h"

#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <charconv>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::stage_transfer {

using namespace cloud_utils;

namespace {

constexpr const char* provider_name = "AZURE";
constexpr const char* metadata_prefix = "x-ms-meta-";

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

auto random_upload_id() -> std::string {
    thread_local std::mt19937_64 generator(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << generator();
    return oss.str();
}

}  // namespace

auto translate_azure_failure(const http_response& response) -> provider_failure {
    provider_failure failure;
    failure.status_code = response.status_code;
    const auto body = response.get_body_string();
    failure.provider_code = response.get_header("x-ms-error-code").value_or(
        extract_xml_element(body, "Code").value_or(""));
    failure.provider_message = extract_xml_element(body, "Message").value_or("");
    return failure;
}

auto make_block_id(const std::string& upload_id, uint32_t part_number) -> std::string {
    std::ostringstream oss;
    oss << upload_id << std::setfill('0') << std::setw(6) << part_number;
    return base64_encode(oss.str());
}

// ============================================================================
// Implementation
// ============================================================================

struct azure_blob_storage_client::impl {
    stage_info stage;
    std::shared_ptr<http_client_interface> http;
    std::string container_url;
    std::string sas;

    /**
     * @brief Blob URL with extra query parameters and the SAS token
     */
    auto blob_url(const std::string& key,
                  const std::map<std::string, std::string>& query = {}) const -> std::string {
        return with_query(container_url + "/" + url_encode(stage.object_key(key), false), query);
    }

    auto with_query(const std::string& base,
                    const std::map<std::string, std::string>& query) const -> std::string {
        std::string url = base;
        std::string separator = "?";
        if (!query.empty()) {
            url += separator + build_query_string(query);
            separator = "&";
        }
        if (!sas.empty()) {
            url += separator + sas;
        }
        return url;
    }

    static auto base_headers() -> http_headers {
        http_headers headers;
        headers["x-ms-version"] = api_version;
        headers["x-ms-date"] = get_rfc1123_time();
        return headers;
    }

    static auto check(const std::string& operation, result<http_response> response)
        -> result<http_response> {
        if (!response) {
            return unexpected{make_transport_error(provider_name, operation, response.error())};
        }
        if (!response.value().is_success()) {
            return unexpected{make_provider_error(provider_name, operation,
                                                  translate_azure_failure(response.value()))};
        }
        return response;
    }
};

azure_blob_storage_client::azure_blob_storage_client(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

azure_blob_storage_client::~azure_blob_storage_client() = default;

auto azure_blob_storage_client::create(const stage_info& stage,
                                       std::shared_ptr<http_client_interface> http_client)
    -> result<std::shared_ptr<azure_blob_storage_client>> {
    const auto* token = std::get_if<sas_token>(&stage.credentials);
    if (token == nullptr) {
        return unexpected{error{error_code::credential_resolution_failed,
            "Azure stage requires a SAS token"}};
    }
    if (stage.storage_account.empty() && stage.endpoint.find("://") == std::string::npos) {
        return unexpected{error{error_code::invalid_stage_descriptor,
            "Azure stage has no storage account"}};
    }
    if (!http_client) {
        return unexpected{error{error_code::internal_error,
            "Azure client requires an HTTP client"}};
    }

    auto state = std::make_unique<impl>();
    state->stage = stage;
    state->http = std::move(http_client);
    state->sas = token->token;
    if (!state->sas.empty() && state->sas.front() == '?') {
        state->sas.erase(0, 1);
    }

    std::string account_url;
    if (stage.endpoint.find("://") != std::string::npos) {
        account_url = stage.endpoint;
    } else {
        const std::string suffix = stage.endpoint.empty() ? "blob.core.windows.net" : stage.endpoint;
        account_url = "https://" + stage.storage_account + "." + suffix;
    }
    while (!account_url.empty() && account_url.back() == '/') {
        account_url.pop_back();
    }
    state->container_url = account_url + "/" + url_encode(stage.bucket);

    ST_LOG_DEBUG(log_category::storage,
        "Created Azure client for container " + state->container_url);

    return std::shared_ptr<azure_blob_storage_client>(
        new azure_blob_storage_client(std::move(state)));
}

auto azure_blob_storage_client::container_url() const -> std::string {
    return impl_->container_url;
}

// ============================================================================
// Object Operations
// ============================================================================

auto azure_blob_storage_client::upload(const std::string& key,
                                       std::span<const std::byte> data,
                                       const object_metadata& metadata) -> result<uint64_t> {
    auto headers = impl::base_headers();
    headers["x-ms-blob-type"] = "BlockBlob";
    headers["Content-Type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, metadata.user_metadata);

    auto response = impl::check("upload",
        impl_->http->put(impl_->blob_url(key), to_body(data), headers));
    if (!response) {
        return unexpected{response.error()};
    }
    return static_cast<uint64_t>(data.size());
}

auto azure_blob_storage_client::download(const std::string& key) -> result<byte_buffer> {
    auto response = impl::check("download",
        impl_->http->get(impl_->blob_url(key), {}, impl::base_headers()));
    if (!response) {
        return unexpected{response.error()};
    }
    return to_byte_buffer(response.value().body);
}

auto azure_blob_storage_client::download_range(const std::string& key,
                                               uint64_t offset,
                                               uint64_t length) -> result<byte_buffer> {
    auto headers = impl::base_headers();
    headers["x-ms-range"] = "bytes=" + std::to_string(offset) + "-" +
                            std::to_string(offset + length - 1);

    auto response = impl::check("download_range",
        impl_->http->get(impl_->blob_url(key), {}, headers));
    if (!response) {
        return unexpected{response.error()};
    }
    return to_byte_buffer(response.value().body);
}

auto azure_blob_storage_client::get_object_metadata(const std::string& key)
    -> result<object_metadata> {
    auto response = impl::check("head",
        impl_->http->head(impl_->blob_url(key), impl::base_headers()));
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

auto azure_blob_storage_client::list(const std::string& prefix)
    -> result<std::vector<object_summary>> {
    std::vector<object_summary> objects;
    std::string marker;
    const auto& stage_prefix = impl_->stage.prefix;

    while (true) {
        std::map<std::string, std::string> query{
            {"restype", "container"},
            {"comp", "list"},
            {"prefix", stage_prefix + prefix},
        };
        if (!marker.empty()) {
            query["marker"] = marker;
        }

        auto response = impl::check("list",
            impl_->http->get(impl_->with_query(impl_->container_url, query), {},
                             impl::base_headers()));
        if (!response) {
            return unexpected{response.error()};
        }

        const auto body = response.value().get_body_string();
        for (const auto& block : extract_xml_blocks(body, "Blob")) {
            auto name = extract_xml_element(block, "Name").value_or("");
            if (name.size() <= stage_prefix.size() ||
                name.compare(0, stage_prefix.size(), stage_prefix) != 0) {
                continue;
            }
            objects.push_back({name.substr(stage_prefix.size()),
                               parse_u64(extract_xml_element(block, "Content-Length").value_or("0"))});
        }

        marker = extract_xml_element(body, "NextMarker").value_or("");
        if (marker.empty()) {
            break;
        }
    }

    return objects;
}

auto azure_blob_storage_client::delete_object(const std::string& key) -> result<void> {
    auto response = impl::check("delete",
        impl_->http->del(impl_->blob_url(key), impl::base_headers()));
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

// ============================================================================
// Multipart Operations (Put Block / Put Block List)
// ============================================================================

auto azure_blob_storage_client::begin_multipart(const std::string& key,
                                                const object_metadata& metadata)
    -> result<multipart_upload> {
    // Blocks need no session; the id only scopes the block ids of this upload
    return multipart_upload{key, random_upload_id(), metadata};
}

auto azure_blob_storage_client::upload_part(const multipart_upload& upload,
                                            uint32_t part_number,
                                            std::span<const std::byte> data)
    -> result<completed_part> {
    const auto block_id = make_block_id(upload.upload_id, part_number);

    auto response = impl::check("upload_part",
        impl_->http->put(impl_->blob_url(upload.key, {{"comp", "block"}, {"blockid", block_id}}),
                         to_body(data), impl::base_headers()));
    if (!response) {
        return unexpected{response.error()};
    }
    return completed_part{part_number, block_id, static_cast<uint64_t>(data.size())};
}

auto azure_blob_storage_client::complete_multipart(const multipart_upload& upload,
                                                   const std::vector<completed_part>& parts)
    -> result<void> {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
    for (const auto& part : parts) {
        xml << "<Latest>" << xml_escape(part.etag) << "</Latest>";
    }
    xml << "</BlockList>";

    auto headers = impl::base_headers();
    headers["Content-Type"] = "application/xml";
    headers["x-ms-blob-content-type"] = "application/octet-stream";
    apply_metadata_headers(headers, metadata_prefix, upload.metadata.user_metadata);

    const auto body = xml.str();
    auto response = impl::check("complete_multipart",
        impl_->http->put(impl_->blob_url(upload.key, {{"comp", "blocklist"}}),
                         std::vector<uint8_t>(body.begin(), body.end()), headers));
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_storage_client::abort_multipart(const multipart_upload& upload) -> result<void> {
    ST_LOG_DEBUG(log_category::storage,
        "Discarding uncommitted blocks of " + upload.key + " (upload " + upload.upload_id + ")");
    return {};
}

}  // namespace kcenon::stage_transfer
