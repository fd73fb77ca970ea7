/**
 * @file result_reporter.h
 * @brief Result rows of a PUT/GET command
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLIENT_RESULT_REPORTER_H
#define KCENON_STAGE_TRANSFER_CLIENT_RESULT_REPORTER_H

#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/core/types.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Outcome of one command: one result per processed file
 */
struct transfer_report {
    transfer_direction direction = transfer_direction::upload;
    /// Results in completion order
    std::vector<transfer_result> results;
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief True when no result has status error
     */
    [[nodiscard]] auto succeeded() const -> bool;

    [[nodiscard]] auto count(transfer_status status) const -> std::size_t;
};

/**
 * @brief One row of the command result set
 */
struct result_row {
    std::string filename;
    std::string target;
    uint64_t source_size = 0;
    uint64_t destination_size = 0;
    std::string status;
    std::string message;
};

/**
 * @brief Turns transfer results into the rows returned to the caller
 */
class result_reporter {
public:
    [[nodiscard]] static auto column_names() -> std::vector<std::string>;

    [[nodiscard]] static auto to_row(const transfer_result& result) -> result_row;

    [[nodiscard]] static auto to_rows(const transfer_report& report) -> std::vector<result_row>;

    [[nodiscard]] static auto all_succeeded(const std::vector<transfer_result>& results) -> bool;

    /**
     * @brief Command status of a report
     * @return transfer_failed naming the failed files when any row is an error
     */
    [[nodiscard]] static auto check(const transfer_report& report) -> result<void>;

    /**
     * @brief Render rows as a fixed-width text table
     */
    [[nodiscard]] static auto format_table(const std::vector<result_row>& rows) -> std::string;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLIENT_RESULT_REPORTER_H
