/**
 * @file result_reporter.cpp
 * @brief Result rows of a PUT/GET command
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/client/result_reporter.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kcenon::stage_transfer {

auto transfer_report::succeeded() const -> bool {
    return result_reporter::all_succeeded(results);
}

auto transfer_report::count(transfer_status status) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(),
        [status](const transfer_result& r) { return r.status == status; }));
}

auto result_reporter::column_names() -> std::vector<std::string> {
    return {"source", "target", "source_size", "target_size", "status", "message"};
}

auto result_reporter::to_row(const transfer_result& result) -> result_row {
    result_row row;
    row.filename = result.source;
    row.target = result.target;
    row.source_size = result.source_size;
    row.destination_size = result.destination_size;
    row.status = to_string(result.status);
    row.message = result.message;
    return row;
}

auto result_reporter::to_rows(const transfer_report& report) -> std::vector<result_row> {
    std::vector<result_row> rows;
    rows.reserve(report.results.size());
    for (const auto& result : report.results) {
        rows.push_back(to_row(result));
    }
    return rows;
}

auto result_reporter::all_succeeded(const std::vector<transfer_result>& results) -> bool {
    return std::none_of(results.begin(), results.end(), [](const transfer_result& r) {
        return r.status == transfer_status::error;
    });
}

auto result_reporter::check(const transfer_report& report) -> result<void> {
    std::vector<std::string> failed;
    for (const auto& result : report.results) {
        if (result.status == transfer_status::error) {
            failed.push_back(result.source);
        }
    }
    if (failed.empty()) {
        return {};
    }

    std::string message = std::to_string(failed.size()) + " of " +
                          std::to_string(report.results.size()) + " files failed to " +
                          (report.direction == transfer_direction::upload ? "upload" : "download") +
                          ":";
    for (const auto& name : failed) {
        message += " " + name;
    }
    return unexpected{error{error_code::transfer_failed, message}};
}

auto result_reporter::format_table(const std::vector<result_row>& rows) -> std::string {
    const auto headers = column_names();
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        cells.push_back({row.filename, row.target, std::to_string(row.source_size),
                         std::to_string(row.destination_size), row.status, row.message});
    }

    std::vector<std::size_t> widths(headers.size());
    for (std::size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
        for (const auto& line : cells) {
            widths[i] = std::max(widths[i], line[i].size());
        }
    }

    std::ostringstream oss;
    auto separator = [&]() {
        oss << "+";
        for (auto width : widths) {
            oss << std::string(width + 2, '-') << "+";
        }
        oss << "\n";
    };
    auto line = [&](const std::vector<std::string>& values) {
        oss << "|";
        for (std::size_t i = 0; i < values.size(); ++i) {
            oss << " " << std::left << std::setw(static_cast<int>(widths[i])) << values[i] << " |";
        }
        oss << "\n";
    };

    separator();
    line(headers);
    separator();
    for (const auto& values : cells) {
        line(values);
    }
    separator();
    return oss.str();
}

}  // namespace kcenon::stage_transfer
