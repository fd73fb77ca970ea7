/**
 * @file credential_resolver.h
 * @brief Resolution of a stage name into a stage_info with credentials
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_CREDENTIAL_RESOLVER_H
#define KCENON_STAGE_TRANSFER_CLOUD_CREDENTIAL_RESOLVER_H

#include "stage_info.h"

#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/core/types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Request sent to the control plane for one command
 */
struct stage_request {
    std::string stage_name;
    /// Path inside the stage without leading or trailing '/'
    std::string stage_path;
    /// Upload credentials are write-only, download credentials read and list
    transfer_direction direction = transfer_direction::upload;
    /// Ask for a downscoped GCS token instead of presigned URLs
    bool downscoped = false;
    /// Source file names, used to mint per-file presigned URLs
    std::vector<std::string> file_names;
};

/**
 * @brief Control-plane session handle
 *
 * describe_stage() returns the JSON stage descriptor:
 * @code
 * {
 *   "locationType": "S3",
 *   "location": "bucket/prefix/",
 *   "region": "us-west-2",
 *   "endPoint": "",
 *   "storageAccount": "",
 *   "useRegionalUrl": false,
 *   "presignedUrl": null,
 *   "creds": {"AWS_KEY_ID": "...", "AWS_SECRET_KEY": "...", "AWS_TOKEN": "..."},
 *   "encryptionMaterial": {"queryStageMasterKey": "...", "queryId": "...", "smkId": 42},
 *   "expiresAt": 1767225600,
 *   "srcLocations": ["a.csv"]
 * }
 * @endcode
 */
class stage_session {
public:
    virtual ~stage_session() = default;

    [[nodiscard]] virtual auto describe_stage(const stage_request& request)
        -> result<std::string> = 0;
};

/**
 * @brief Turns a stage reference into a stage_info
 *
 * Every failure is reported in the credential resolution category, so a
 * command aborts before any task is scheduled.
 */
class credential_resolver {
public:
    explicit credential_resolver(std::shared_ptr<stage_session> session);

    /**
     * @brief Ask the session for a descriptor and parse it
     *
     * The request's stage path is appended to the descriptor's prefix.
     */
    [[nodiscard]] auto resolve(const stage_request& request) const -> result<stage_info>;

    /**
     * @brief Parse and validate a stage descriptor
     */
    [[nodiscard]] static auto parse_descriptor(const std::string& descriptor)
        -> result<stage_info>;

    /**
     * @brief Decode a base64 master key and check its length (16 or 32 bytes)
     */
    [[nodiscard]] static auto decode_master_key(const std::string& encoded)
        -> result<std::vector<uint8_t>>;

    /**
     * @brief Split "bucket/some/prefix" into bucket and "some/prefix/"
     */
    static void split_location(const std::string& location,
                               std::string& bucket,
                               std::string& prefix);

private:
    std::shared_ptr<stage_session> session_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_CREDENTIAL_RESOLVER_H
