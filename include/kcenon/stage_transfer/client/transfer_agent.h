/**
 * @file transfer_agent.h
 * @brief Orchestrator of one PUT or GET command
 * @version 0.1.0
 *
 * @code
 * transfer_context context;
 * context.session_handle = session;
 * auto agent = transfer_agent::create("PUT file:///data/*.csv @stage/daily", context);
 * if (agent) {
 *     auto report = agent.value()->execute();
 * }
 * @endcode
 */

#ifndef KCENON_STAGE_TRANSFER_CLIENT_TRANSFER_AGENT_H
#define KCENON_STAGE_TRANSFER_CLIENT_TRANSFER_AGENT_H

#include "kcenon/stage_transfer/client/file_pipeline.h"
#include "kcenon/stage_transfer/client/file_transfer_metadata.h"
#include "kcenon/stage_transfer/client/result_reporter.h"
#include "kcenon/stage_transfer/cloud/credential_resolver.h"
#include "kcenon/stage_transfer/cloud/storage_client_factory.h"
#include "kcenon/stage_transfer/command/session_parameters.h"
#include "kcenon/stage_transfer/core/transfer_types.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Collaborators of one command
 */
struct transfer_context {
    session_parameters session;
    std::shared_ptr<stage_session> session_handle;

    /// Creates the storage client; storage_client_factory::create when empty
    storage_client_factory_fn client_factory;

    /// Writes downloaded files; atomic publish when empty
    local_writer_fn local_writer;

    /// Overrides of the policies derived from the session
    std::optional<retry_policy> retry;
    std::optional<multipart_config> multipart;

    /// Object name for a PUT that matches exactly one file
    std::optional<std::string> destination_filename;

    /// Identifier attached to every log entry of the command
    std::string command_id;
};

/**
 * @brief Runs one PUT or GET command
 *
 * create() parses the command and resolves the stage, so usage and
 * credential errors surface before any file is touched. execute() then
 * processes every file on a pool of `parallel` workers and returns one
 * result per file.
 *
 * @note cancel() may be called from any thread while execute() runs.
 */
class transfer_agent {
public:
    [[nodiscard]] static auto create(std::string_view command, transfer_context context)
        -> result<std::unique_ptr<transfer_agent>>;

    ~transfer_agent();

    transfer_agent(const transfer_agent&) = delete;
    auto operator=(const transfer_agent&) -> transfer_agent& = delete;

    /**
     * @brief Transfer every file of the command
     *
     * Per-file failures are reported in the rows. An error is returned only
     * for command-level failures: no file matched, the stage listing
     * failed, or the storage client could not be created.
     */
    [[nodiscard]] auto execute() -> result<transfer_report>;

    /**
     * @brief Stop dispatching and interrupt in-flight retries
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Metadata for uploads made later without this session
     *
     * Presigned stages yield one single-file metadata per source name;
     * other stages yield one multi-file metadata.
     *
     * @return unsupported_operation for GET
     */
    [[nodiscard]] auto file_transfer_metadatas() const
        -> result<std::vector<file_transfer_metadata>>;

    [[nodiscard]] auto intent() const -> const transfer_intent&;

    [[nodiscard]] auto stage() const -> const stage_info&;

private:
    struct impl;
    explicit transfer_agent(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create an agent, execute it and check the rows
 * @return The report, or transfer_failed when any row is an error
 */
[[nodiscard]] auto run_transfer_command(std::string_view command, transfer_context context)
    -> result<transfer_report>;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLIENT_TRANSFER_AGENT_H
