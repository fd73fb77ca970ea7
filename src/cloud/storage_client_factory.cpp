/**
 * @file storage_client_factory.cpp
 * @brief Storage client factory implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/storage_client_factory.h"

#include "kcenon/stage_transfer/cloud/azure_blob_storage.h"
#include "kcenon/stage_transfer/cloud/gcs_storage.h"
#include "kcenon/stage_transfer/cloud/local_storage.h"
#include "kcenon/stage_transfer/cloud/s3_storage.h"
#include "kcenon/stage_transfer/core/logging.h"

namespace kcenon::stage_transfer {

namespace {

template <typename Client>
auto upcast(result<std::shared_ptr<Client>> created) -> result<std::shared_ptr<storage_client>> {
    if (!created) {
        return unexpected{created.error()};
    }
    return std::shared_ptr<storage_client>(std::move(created.value()));
}

}  // namespace

auto storage_client_factory::create(const stage_info& stage,
                                    const storage_client_options& options,
                                    std::shared_ptr<http_client_interface> http_client)
    -> result<std::shared_ptr<storage_client>> {
    if (stage.kind == provider_kind::local_fs) {
        return upcast(local_storage_client::create(stage));
    }

    if (!http_client) {
        http_client = make_cloud_http_client(options.request_timeout);
    }

    ST_LOG_DEBUG(log_category::storage,
        std::string("Creating ") + to_string(stage.kind) + " client with " +
        credential_kind_name(stage.credentials) + " credentials");

    switch (stage.kind) {
        case provider_kind::s3:
            return upcast(s3_storage_client::create(stage, std::move(http_client)));
        case provider_kind::azure:
            return upcast(azure_blob_storage_client::create(stage, std::move(http_client)));
        case provider_kind::gcs:
            return upcast(gcs_storage_client::create(stage, std::move(http_client)));
        default:
            break;
    }

    return unexpected{error{error_code::invalid_stage_descriptor,
        "unsupported stage location type"}};
}

auto storage_client_factory::default_factory() -> storage_client_factory_fn {
    return [](const stage_info& stage, const storage_client_options& options) {
        return storage_client_factory::create(stage, options);
    };
}

}  // namespace kcenon::stage_transfer
