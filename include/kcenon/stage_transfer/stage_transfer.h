/**
 * @file stage_transfer.h
 * @brief Main header for the stage_transfer library
 * @version 0.1.0
 *
 * Include this header to access the PUT/GET transfer engine.
 *
 * @code
 * #include <kcenon/stage_transfer/stage_transfer.h>
 *
 * using namespace kcenon::stage_transfer;
 *
 * transfer_context context;
 * context.session_handle = session;
 * auto report = run_transfer_command("PUT file:///data/*.csv @stage", context);
 * if (report) {
 *     std::cout << result_reporter::format_table(result_reporter::to_rows(report.value()));
 * }
 * @endcode
 */

#ifndef KCENON_STAGE_TRANSFER_STAGE_TRANSFER_H
#define KCENON_STAGE_TRANSFER_STAGE_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/stage_transfer/core/types.h"
#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/transfer_types.h"

// Command
#include "kcenon/stage_transfer/command/command_parser.h"
#include "kcenon/stage_transfer/command/session_parameters.h"

// Storage
#include "kcenon/stage_transfer/cloud/credential_resolver.h"
#include "kcenon/stage_transfer/cloud/storage_client_factory.h"

// Client
#include "kcenon/stage_transfer/client/file_transfer_metadata.h"
#include "kcenon/stage_transfer/client/result_reporter.h"
#include "kcenon/stage_transfer/client/transfer_agent.h"

namespace kcenon::stage_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_STAGE_TRANSFER_H
