/**
 * @file file_pipeline.h
 * @brief Per-file upload and download pipeline
 * @version 0.1.0
 *
 * Upload:   read -> LZ4 (optional) -> digest and envelope -> single PUT or multipart
 * Download: HEAD -> GET or ranged GETs -> open and verify -> LZ4 (optional) -> atomic write
 */

#ifndef KCENON_STAGE_TRANSFER_CLIENT_FILE_PIPELINE_H
#define KCENON_STAGE_TRANSFER_CLIENT_FILE_PIPELINE_H

#include "kcenon/stage_transfer/cloud/cloud_config.h"
#include "kcenon/stage_transfer/cloud/retry_executor.h"
#include "kcenon/stage_transfer/cloud/storage_client.h"
#include "kcenon/stage_transfer/core/cancellation_token.h"
#include "kcenon/stage_transfer/core/compression_engine.h"
#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/encryption/envelope_codec.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Writes a verified payload to its local destination
 *
 * The default publishes through atomic_file_writer; tests substitute
 * writers that fail the way a full disk does.
 */
using local_writer_fn =
    std::function<result<void>(const std::filesystem::path&, std::span<const std::byte>)>;

/**
 * @brief Settings shared by every file of one command
 */
struct pipeline_settings {
    uint64_t threshold = transfer_options::default_threshold;
    retry_policy retry;
    multipart_config multipart;
    std::string command_id;

    /// Renews the client's credentials on token_expired; none when empty
    credential_refresh_fn refresh_credentials;
};

/**
 * @brief Storage client options derived from a command's options
 */
[[nodiscard]] auto make_client_options(const transfer_options& options)
    -> storage_client_options;

/**
 * @brief Pipeline settings derived from a command's options
 */
[[nodiscard]] auto make_pipeline_settings(const transfer_options& options,
                                          std::string command_id) -> pipeline_settings;

/**
 * @brief Runs the transfer of single files against one storage client
 *
 * Every call produces exactly one transfer_result and never throws for
 * transfer failures; the error is captured in the row.
 *
 * @note This pipeline is thread-safe for concurrent operations.
 */
class file_pipeline {
public:
    file_pipeline(std::shared_ptr<storage_client> client,
                  std::shared_ptr<envelope_codec> codec,
                  pipeline_settings settings,
                  std::shared_ptr<cancellation_token> token = nullptr,
                  local_writer_fn writer = nullptr);

    ~file_pipeline();

    file_pipeline(const file_pipeline&) = delete;
    auto operator=(const file_pipeline&) -> file_pipeline& = delete;

    /**
     * @brief Read task.source and upload it as task.target
     */
    [[nodiscard]] auto upload_file(const transfer_task& task) const -> transfer_result;

    /**
     * @brief Upload an in-memory payload as task.target
     */
    [[nodiscard]] auto upload_buffer(const transfer_task& task,
                                     std::span<const std::byte> raw) const -> transfer_result;

    /**
     * @brief Download task.source into directory / task.target
     */
    [[nodiscard]] auto download_object(const transfer_task& task,
                                       const std::filesystem::path& directory) const
        -> transfer_result;

    /**
     * @brief Build the upload task of a local file
     *
     * Reads the size and the leading bytes of the file to decide the
     * source compression and whether the payload is LZ4-compressed, which
     * also fixes the target name.
     */
    [[nodiscard]] static auto plan_upload(const std::filesystem::path& path,
                                          const transfer_options& options)
        -> result<transfer_task>;

    /**
     * @brief Decide compression for a payload given its name and leading bytes
     */
    static void decide_compression(transfer_task& task,
                                   const transfer_options& options,
                                   std::span<const std::byte> head);

    [[nodiscard]] auto client() const -> const std::shared_ptr<storage_client>&;

    [[nodiscard]] auto settings() const -> const pipeline_settings&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLIENT_FILE_PIPELINE_H
