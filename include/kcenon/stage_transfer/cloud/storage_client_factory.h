/**
 * @file storage_client_factory.h
 * @brief Selects the storage client implementation for a resolved stage
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_FACTORY_H
#define KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_FACTORY_H

#include "cloud_config.h"
#include "cloud_http_client.h"
#include "stage_info.h"
#include "storage_client.h"

#include <functional>
#include <memory>

namespace kcenon::stage_transfer {

/**
 * @brief Function that builds a storage client for a stage
 *
 * Commands hold one of these so tests can substitute in-memory clients.
 */
using storage_client_factory_fn = std::function<
    result<std::shared_ptr<storage_client>>(const stage_info&, const storage_client_options&)>;

/**
 * @brief Factory for storage clients
 *
 * @code
 * auto client = storage_client_factory::create(stage, options);
 * if (client) {
 *     auto objects = client.value()->list("");
 * }
 * @endcode
 */
class storage_client_factory {
public:
    /**
     * @brief Create the client matching stage.kind
     * @param http_client HTTP client to use; when null a network_system
     *        client with options.request_timeout is created
     */
    [[nodiscard]] static auto create(const stage_info& stage,
                                     const storage_client_options& options,
                                     std::shared_ptr<http_client_interface> http_client = nullptr)
        -> result<std::shared_ptr<storage_client>>;

    /**
     * @brief Factory function bound to create() with the default HTTP client
     */
    [[nodiscard]] static auto default_factory() -> storage_client_factory_fn;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_STORAGE_CLIENT_FACTORY_H
