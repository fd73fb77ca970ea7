/**
 * @file file_transfer_metadata.h
 * @brief Stage metadata for uploads made without a session
 * @version 0.1.0
 *
 * A connected agent hands out file_transfer_metadata; the holder can then
 * upload streams to the stage with upload_without_connection() while the
 * stage credentials remain valid.
 *
 * @code
 * auto metas = agent->file_transfer_metadatas();
 * auto config = upload_config::builder()
 *     .with_metadata(metas.value().front())
 *     .with_input_stream(std::make_shared<std::ifstream>("rows.csv", std::ios::binary))
 *     .with_destination_filename("rows.csv")
 *     .build();
 * if (config) {
 *     auto row = upload_without_connection(config.value());
 * }
 * @endcode
 */

#ifndef KCENON_STAGE_TRANSFER_CLIENT_FILE_TRANSFER_METADATA_H
#define KCENON_STAGE_TRANSFER_CLIENT_FILE_TRANSFER_METADATA_H

#include "kcenon/stage_transfer/cloud/stage_info.h"
#include "kcenon/stage_transfer/cloud/storage_client_factory.h"
#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/core/types.h"

#include <atomic>
#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Resolved stage plus the options of the command that produced it
 *
 * Single-file metadata is bound to one destination name and may be
 * consumed once; copies share the consumed flag. Multi-file metadata is
 * reusable with a new destination name for every upload.
 */
class file_transfer_metadata {
public:
    [[nodiscard]] static auto single_file(stage_info stage,
                                          transfer_options options,
                                          std::string destination_filename)
        -> file_transfer_metadata;

    [[nodiscard]] static auto multi_file(stage_info stage, transfer_options options)
        -> file_transfer_metadata;

    [[nodiscard]] auto is_single_file() const -> bool;

    [[nodiscard]] auto stage() const -> const stage_info&;

    [[nodiscard]] auto options() const -> const transfer_options&;

    /**
     * @brief Destination bound to a single-file metadata
     */
    [[nodiscard]] auto destination_filename() const -> const std::optional<std::string>&;

    [[nodiscard]] auto is_consumed() const -> bool;

    /**
     * @brief Mark a single-file metadata as used
     * @return false when it had been consumed already
     */
    [[nodiscard]] auto try_consume() const -> bool;

private:
    struct state;
    explicit file_transfer_metadata(std::shared_ptr<state> state);
    std::shared_ptr<state> state_;
};

/**
 * @brief Parameters of one disconnected upload
 */
class upload_config {
public:
    class builder {
    public:
        builder();

        auto with_metadata(file_transfer_metadata metadata) -> builder&;

        auto with_input_stream(std::shared_ptr<std::istream> stream) -> builder&;

        /**
         * @brief Object name; required for multi-file metadata
         */
        auto with_destination_filename(std::string filename) -> builder&;

        /**
         * @brief LZ4-compress the stream before upload (default: false)
         */
        auto with_require_compress(bool require) -> builder&;

        auto with_network_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_ingest_client_name(std::string name) -> builder&;

        auto with_ingest_client_key(std::string key) -> builder&;

        /**
         * @brief Override the stage's regional endpoint choice (S3 and GCS)
         */
        auto with_use_regional_url(bool use_regional_url) -> builder&;

        /**
         * @return invalid_parameter when no metadata was set
         */
        [[nodiscard]] auto build() -> result<upload_config>;

    private:
        std::optional<file_transfer_metadata> metadata_;
        std::shared_ptr<std::istream> stream_;
        std::optional<std::string> destination_filename_;
        bool require_compress_ = false;
        std::optional<std::chrono::milliseconds> network_timeout_;
        std::optional<std::string> ingest_client_name_;
        std::optional<std::string> ingest_client_key_;
        std::optional<bool> use_regional_url_;
    };

    [[nodiscard]] auto metadata() const -> const file_transfer_metadata& { return metadata_; }
    [[nodiscard]] auto input_stream() const -> const std::shared_ptr<std::istream>& {
        return stream_;
    }
    [[nodiscard]] auto destination_filename() const -> const std::optional<std::string>& {
        return destination_filename_;
    }
    [[nodiscard]] auto require_compress() const -> bool { return require_compress_; }
    [[nodiscard]] auto network_timeout() const -> const std::optional<std::chrono::milliseconds>& {
        return network_timeout_;
    }
    [[nodiscard]] auto ingest_client_name() const -> const std::optional<std::string>& {
        return ingest_client_name_;
    }
    [[nodiscard]] auto ingest_client_key() const -> const std::optional<std::string>& {
        return ingest_client_key_;
    }
    [[nodiscard]] auto use_regional_url() const -> const std::optional<bool>& {
        return use_regional_url_;
    }

private:
    explicit upload_config(file_transfer_metadata metadata);

    file_transfer_metadata metadata_;
    std::shared_ptr<std::istream> stream_;
    std::optional<std::string> destination_filename_;
    bool require_compress_ = false;
    std::optional<std::chrono::milliseconds> network_timeout_;
    std::optional<std::string> ingest_client_name_;
    std::optional<std::string> ingest_client_key_;
    std::optional<bool> use_regional_url_;
};

/**
 * @brief Upload one stream through the per-file pipeline without a session
 *
 * Usage errors (a consumed single-file metadata, a missing stream, a
 * missing or mismatched destination name) are returned before any storage
 * client is created.
 *
 * @param factory Storage client factory; the default factory when empty
 * @return The uploaded row, or the failure of the transfer
 */
[[nodiscard]] auto upload_without_connection(const upload_config& config,
                                             const storage_client_factory_fn& factory = {})
    -> result<transfer_result>;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLIENT_FILE_TRANSFER_METADATA_H
