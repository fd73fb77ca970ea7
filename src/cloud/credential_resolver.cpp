/**
 * @file credential_resolver.cpp
 * @brief Stage descriptor parsing and validation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/credential_resolver.h"

#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <charconv>
#include <chrono>

namespace kcenon::stage_transfer {

using namespace cloud_utils;

namespace {

auto descriptor_error(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_stage_descriptor, std::move(message)}};
}

auto missing_credentials(const char* provider, const char* what) -> unexpected {
    return unexpected{error{error_code::credential_resolution_failed,
        std::string(provider) + " stage descriptor has no " + what}};
}

auto parse_provider(const std::string& location_type) -> std::optional<provider_kind> {
    const auto type = detail::to_lower(location_type);
    if (type == "s3") return provider_kind::s3;
    if (type == "azure") return provider_kind::azure;
    if (type == "gcs") return provider_kind::gcs;
    if (type == "local_fs") return provider_kind::local_fs;
    return std::nullopt;
}

auto parse_int64(const std::string& text) -> std::optional<int64_t> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto non_empty(const std::optional<std::string>& value) -> bool {
    return value.has_value() && !value->empty();
}

}  // namespace

credential_resolver::credential_resolver(std::shared_ptr<stage_session> session)
    : session_(std::move(session)) {}

void credential_resolver::split_location(const std::string& location,
                                         std::string& bucket,
                                         std::string& prefix) {
    const auto slash = location.find('/');
    if (slash == std::string::npos) {
        bucket = location;
        prefix.clear();
        return;
    }
    bucket = location.substr(0, slash);
    prefix = location.substr(slash + 1);
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
}

auto credential_resolver::decode_master_key(const std::string& encoded)
    -> result<std::vector<uint8_t>> {
    auto key = base64_decode(encoded);
    if (!key) {
        return unexpected{error{error_code::credential_resolution_failed,
            "query stage master key is not valid base64"}};
    }
    if (key->size() != 16 && key->size() != 32) {
        return unexpected{error{error_code::credential_resolution_failed,
            "query stage master key must be 16 or 32 bytes, got " +
            std::to_string(key->size())}};
    }
    return std::move(*key);
}

auto credential_resolver::parse_descriptor(const std::string& descriptor) -> result<stage_info> {
    const auto location_type = extract_json_value(descriptor, "locationType");
    if (!non_empty(location_type)) {
        return descriptor_error("stage descriptor has no locationType");
    }
    const auto kind = parse_provider(*location_type);
    if (!kind) {
        return descriptor_error("unknown stage location type: " + *location_type);
    }

    stage_info stage;
    stage.kind = *kind;
    stage.location = extract_json_value(descriptor, "location").value_or("");
    if (stage.location.empty()) {
        return descriptor_error("stage descriptor has no location");
    }

    if (stage.kind == provider_kind::local_fs) {
        stage.bucket = stage.location;
        while (stage.bucket.size() > 1 && stage.bucket.back() == '/') {
            stage.bucket.pop_back();
        }
    } else {
        split_location(stage.location, stage.bucket, stage.prefix);
    }

    stage.region = extract_json_value(descriptor, "region").value_or("");
    stage.endpoint = extract_json_value(descriptor, "endPoint").value_or("");
    stage.storage_account = extract_json_value(descriptor, "storageAccount").value_or("");
    stage.use_regional_url = extract_json_value(descriptor, "useRegionalUrl").value_or("") == "true";

    const auto creds = extract_json_object(descriptor, "creds").value_or("{}");
    const auto presigned = extract_json_value(descriptor, "presignedUrl");

    switch (stage.kind) {
        case provider_kind::s3: {
            temporary_keys keys;
            keys.access_key_id = extract_json_value(creds, "AWS_KEY_ID").value_or("");
            keys.secret_access_key = extract_json_value(creds, "AWS_SECRET_KEY").value_or("");
            keys.session_token = extract_json_value(creds, "AWS_TOKEN").value_or("");
            if (keys.access_key_id.empty() || keys.secret_access_key.empty()) {
                return missing_credentials("S3", "AWS_KEY_ID/AWS_SECRET_KEY");
            }
            stage.credentials = std::move(keys);
            break;
        }
        case provider_kind::azure: {
            auto token = extract_json_value(creds, "AZURE_SAS_TOKEN");
            if (!non_empty(token)) {
                return missing_credentials("AZURE", "AZURE_SAS_TOKEN");
            }
            if (stage.storage_account.empty()) {
                return descriptor_error("AZURE stage descriptor has no storageAccount");
            }
            stage.credentials = sas_token{*token};
            break;
        }
        case provider_kind::gcs: {
            auto token = extract_json_value(creds, "GCS_ACCESS_TOKEN");
            if (non_empty(presigned)) {
                stage.credentials = presigned_url{*presigned};
            } else if (non_empty(token)) {
                stage.credentials = downscoped_token{*token};
            } else {
                return missing_credentials("GCS", "GCS_ACCESS_TOKEN or presignedUrl");
            }
            break;
        }
        case provider_kind::local_fs:
            stage.credentials = no_credentials{};
            break;
    }

    if (auto material = extract_json_object(descriptor, "encryptionMaterial")) {
        auto master_key = extract_json_value(*material, "queryStageMasterKey");
        if (non_empty(master_key)) {
            auto decoded = decode_master_key(*master_key);
            if (!decoded) {
                return unexpected{decoded.error()};
            }
            encryption_material encryption;
            encryption.query_stage_master_key = *master_key;
            encryption.query_id = extract_json_value(*material, "queryId").value_or("");
            encryption.smk_id =
                parse_int64(extract_json_value(*material, "smkId").value_or("0")).value_or(0);
            stage.encryption = std::move(encryption);
        }
    }

    if (auto expires = extract_json_value(descriptor, "expiresAt")) {
        auto seconds = parse_int64(*expires);
        if (!seconds) {
            return descriptor_error("stage descriptor has an invalid expiresAt: " + *expires);
        }
        stage.expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(*seconds));
        if (stage.is_expired()) {
            return unexpected{error{error_code::session_expired,
                "stage credentials expired before use"}};
        }
    }

    if (auto sources = extract_json_string_array(descriptor, "srcLocations")) {
        stage.source_locations = std::move(*sources);
    }

    return stage;
}

auto credential_resolver::resolve(const stage_request& request) const -> result<stage_info> {
    if (!session_) {
        return unexpected{error{error_code::credential_resolution_failed,
            "no session to resolve stage @" + request.stage_name}};
    }

    ST_LOG_DEBUG(log_category::credential,
        "Describing stage @" + request.stage_name + " for " + to_string(request.direction));

    auto descriptor = session_->describe_stage(request);
    if (!descriptor) {
        const auto& failure = descriptor.error();
        if (category_of(failure.code) == error_category::credential_resolution) {
            return unexpected{failure};
        }
        return unexpected{error{error_code::credential_resolution_failed,
            "failed to describe stage @" + request.stage_name + ": " + failure.message}};
    }

    auto stage = parse_descriptor(descriptor.value());
    if (!stage) {
        ST_LOG_WARN(log_category::credential,
            "Rejected descriptor of stage @" + request.stage_name + ": " +
            stage.error().message);
        return stage;
    }

    auto& info = stage.value();
    if (!request.stage_path.empty()) {
        info.prefix += request.stage_path + "/";
    }

    ST_LOG_INFO(log_category::credential,
        "Resolved stage @" + request.stage_name + " to " + to_string(info.kind) + " " +
        info.bucket + "/" + info.prefix + " with " + credential_kind_name(info.credentials) +
        " credentials" + (info.is_encrypted() ? ", client-side encryption" : ""));

    return stage;
}

}  // namespace kcenon::stage_transfer
