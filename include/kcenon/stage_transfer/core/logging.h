// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

namespace kcenon::stage_transfer {

/**
 * @brief Log categories for the stage transfer subsystem
 */
struct log_category {
    static constexpr std::string_view command = "stage_transfer.command";
    static constexpr std::string_view credential = "stage_transfer.credential";
    static constexpr std::string_view storage = "stage_transfer.storage";
    static constexpr std::string_view retry = "stage_transfer.retry";
    static constexpr std::string_view encryption = "stage_transfer.encryption";
    static constexpr std::string_view compression = "stage_transfer.compression";
    static constexpr std::string_view agent = "stage_transfer.agent";
    static constexpr std::string_view pool = "stage_transfer.pool";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief What the masker hides
 *
 * Credential masking is on unless explicitly disabled; stage credentials,
 * SAS signatures and presigned URL signatures must never reach a log sink.
 */
struct masking_config {
    bool mask_credentials = true;
    bool mask_paths = false;
    bool mask_ips = false;
    std::string mask_char = "*";
    std::size_t visible_chars = 4;

    [[nodiscard]] static auto all_masked() -> masking_config {
        masking_config config;
        config.mask_paths = true;
        config.mask_ips = true;
        return config;
    }
};

/**
 * @brief Hides secrets, and optionally paths and addresses, in log text
 *
 * Recognized secrets: descriptor credential fields (AWS_SECRET_KEY,
 * AWS_TOKEN, AZURE_SAS_TOKEN, GCS_ACCESS_TOKEN, queryStageMasterKey),
 * Authorization and Bearer values, SigV4 signatures, and the sig,
 * X-Amz-Signature, X-Amz-Security-Token and X-Goog-Signature query
 * parameters of presigned and SAS URLs.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {}) : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Keep visible_chars leading characters, mask the rest
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string;

    /**
     * @brief Keep the file name, mask the directory
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    /**
     * @brief Keep the last octet, mask the rest
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string;

    [[nodiscard]] auto config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = std::move(config); }

private:
    [[nodiscard]] auto fill(std::size_t count) const -> std::string {
        return std::string(count, config_.mask_char.empty() ? '*' : config_.mask_char.front());
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] auto escape_json_string(std::string_view input) -> std::string;

}  // namespace detail

/**
 * @brief Structured log context for one file transfer
 */
struct transfer_log_context {
    std::string command_id;
    std::string filename;
    std::optional<std::string> provider;
    std::optional<uint64_t> file_size;
    std::optional<uint32_t> part_index;
    std::optional<uint32_t> total_parts;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief JSON object of the fields that are set
     * @param masker Applied to the file name and error message when given
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief One log entry as written in JSON output
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto json = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::agent)
 *     .with_message("Upload completed")
 *     .with_command_id("put-17")
 *     .with_filename("orders.csv")
 *     .with_file_size(1048576)
 *     .build_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder();

    auto with_level(log_level level) -> log_entry_builder&;
    auto with_category(std::string_view category) -> log_entry_builder&;
    auto with_message(std::string_view message) -> log_entry_builder&;
    auto with_command_id(std::string_view id) -> log_entry_builder&;
    auto with_filename(std::string_view filename) -> log_entry_builder&;
    auto with_provider(std::string_view provider) -> log_entry_builder&;
    auto with_file_size(uint64_t size) -> log_entry_builder&;
    auto with_part(uint32_t index, uint32_t total) -> log_entry_builder&;
    auto with_attempt(uint32_t attempt) -> log_entry_builder&;
    auto with_duration_ms(uint64_t duration) -> log_entry_builder&;
    auto with_error_message(std::string_view error) -> log_entry_builder&;
    auto with_source_location(const char* file, int line) -> log_entry_builder&;
    auto with_context(const transfer_log_context& ctx) -> log_entry_builder&;

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> transfer_log_context&;

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger of the stage transfer subsystem
 *
 * Every message is masked before it reaches a callback or a sink. With
 * logger_system and common_system available, entries go to a
 * kcenon::logger::logger once initialize() has run; otherwise to stderr.
 *
 * @note All members are safe to call from worker threads.
 */
class stage_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    stage_transfer_logger();
    ~stage_transfer_logger();

    stage_transfer_logger(const stage_transfer_logger&) = delete;
    auto operator=(const stage_transfer_logger&) -> stage_transfer_logger& = delete;

    /**
     * @brief Attach the logger_system backend; later calls do nothing
     */
    void initialize();

    void shutdown();

    [[nodiscard]] auto is_initialized() const -> bool;

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level;

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    /**
     * @brief Receive every enabled entry with its masked message
     */
    void set_callback(log_callback callback);

    /**
     * @brief Receive every enabled entry as masked JSON (json format only)
     */
    void set_json_callback(json_log_callback callback);

    /**
     * @brief Suppress the default stderr sink (callbacks still fire)
     */
    void set_console_output(bool enable);

    [[nodiscard]] auto is_enabled(log_level level) const -> bool;

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0);

    void flush();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Get global logger instance
 */
auto get_logger() -> stage_transfer_logger&;

// Logging macros for convenience
#define ST_LOG(level, category, message) \
    kcenon::stage_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define ST_LOG_CTX(level, category, message, context) \
    kcenon::stage_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define ST_LOG_TRACE(category, message) \
    ST_LOG(kcenon::stage_transfer::log_level::trace, category, message)

#define ST_LOG_DEBUG(category, message) \
    ST_LOG(kcenon::stage_transfer::log_level::debug, category, message)

#define ST_LOG_INFO(category, message) \
    ST_LOG(kcenon::stage_transfer::log_level::info, category, message)

#define ST_LOG_WARN(category, message) \
    ST_LOG(kcenon::stage_transfer::log_level::warn, category, message)

#define ST_LOG_ERROR(category, message) \
    ST_LOG(kcenon::stage_transfer::log_level::error, category, message)

#define ST_LOG_DEBUG_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::stage_transfer::log_level::debug, category, message, ctx)

#define ST_LOG_INFO_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::stage_transfer::log_level::info, category, message, ctx)

#define ST_LOG_WARN_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::stage_transfer::log_level::warn, category, message, ctx)

#define ST_LOG_ERROR_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::stage_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::stage_transfer
