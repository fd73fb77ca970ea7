/**
 * @file transfer_agent.cpp
 * @brief Orchestrator of one PUT or GET command
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/client/transfer_agent.h"

#include "kcenon/stage_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/stage_transfer/cloud/renewable_storage_client.h"
#include "kcenon/stage_transfer/cloud/retry_executor.h"
#include "kcenon/stage_transfer/command/command_parser.h"
#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/local_file.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <mutex>
#include <regex>
#include <set>
#include <utility>

namespace kcenon::stage_transfer {

namespace {

auto ends_with(std::string_view text, std::string_view suffix) -> bool {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto basename_of(const std::string& path) -> std::string {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

auto error_row(const transfer_task& task, const error& failure) -> transfer_result {
    transfer_result row;
    row.source = task.name;
    row.target = task.target;
    row.source_size = task.size;
    row.status = transfer_status::error;
    row.code = failure.code;
    row.message = describe(failure);
    return row;
}

auto skipped_row(const transfer_task& task, std::string message) -> transfer_result {
    transfer_result row;
    row.source = task.name;
    row.target = task.target;
    row.source_size = task.size;
    row.status = transfer_status::skipped;
    row.message = std::move(message);
    return row;
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct transfer_agent::impl {
    transfer_context context;
    transfer_intent intent;
    stage_info stage;
    credential_resolver resolver;
    std::shared_ptr<cancellation_token> token = cancellation_token::create();

    pipeline_settings settings;
    storage_client_options client_options;

    std::shared_ptr<file_pipeline> shared_pipeline;

    // Serializes credential refreshes of every pipeline of the command
    mutable std::mutex refresh_mutex;

    impl(transfer_context ctx, transfer_intent parsed)
        : context(std::move(ctx)),
          intent(std::move(parsed)),
          resolver(context.session_handle) {
        settings = make_pipeline_settings(intent.options, context.command_id);
        client_options = make_client_options(intent.options);
        if (context.retry) {
            settings.retry = *context.retry;
            client_options.retry = *context.retry;
        }
        if (context.multipart) {
            settings.multipart = *context.multipart;
            client_options.multipart = *context.multipart;
        }
        if (!context.client_factory) {
            context.client_factory = storage_client_factory::default_factory();
        }
    }

    auto make_request(std::vector<std::string> file_names) const -> stage_request {
        stage_request request;
        request.stage_name = intent.stage_name;
        request.stage_path = intent.stage_path;
        request.direction = intent.direction;
        request.downscoped = intent.options.gcs_use_downscoped_credential;
        request.file_names = std::move(file_names);
        return request;
    }

    auto resolve(std::vector<std::string> file_names) const -> result<stage_info> {
        auto resolved = resolver.resolve(make_request(std::move(file_names)));
        if (resolved) {
            auto& info = resolved.value();
            info.use_regional_url = info.use_regional_url || intent.options.use_regional_url;
        }
        return resolved;
    }

    /**
     * @brief Hook that re-resolves the stage and renews @p target
     *
     * Workers that hit token_expired together trigger one resolution: a
     * worker that finds the client renewed while it waited returns at once.
     */
    auto make_refresh(std::shared_ptr<renewable_storage_client> target,
                      std::vector<std::string> file_names) const -> credential_refresh_fn {
        return [this, target, file_names = std::move(file_names)]() -> result<void> {
            const auto seen = target->generation();
            std::lock_guard lock(refresh_mutex);
            if (target->generation() != seen) {
                return {};
            }

            auto renewed_stage = resolve(file_names);
            if (!renewed_stage) {
                return unexpected{renewed_stage.error()};
            }
            auto renewed = context.client_factory(renewed_stage.value(), client_options);
            if (!renewed) {
                return unexpected{renewed.error()};
            }
            target->renew(renewed.value());

            ST_LOG_INFO(log_category::credential,
                "Renewed expired credentials of @" + intent.stage_name);
            return {};
        };
    }

    auto build_pipeline(const stage_info& target_stage, std::vector<std::string> file_names) const
        -> result<std::shared_ptr<file_pipeline>> {
        auto client = context.client_factory(target_stage, client_options);
        if (!client) {
            return unexpected{client.error()};
        }
        auto codec = envelope_codec::create(target_stage.encryption);
        if (!codec) {
            return unexpected{codec.error()};
        }

        auto renewable = std::make_shared<renewable_storage_client>(client.value());
        auto pipeline_config = settings;
        pipeline_config.refresh_credentials = make_refresh(renewable, std::move(file_names));
        return std::make_shared<file_pipeline>(renewable, codec.value(),
                                               std::move(pipeline_config), token,
                                               context.local_writer);
    }

    auto upload_file_names() const -> std::vector<std::string> {
        std::vector<std::string> file_names;
        if (intent.is_upload()) {
            for (const auto& pattern : intent.local_paths) {
                file_names.push_back(basename_of(pattern));
            }
        }
        return file_names;
    }

    auto pipeline() -> result<std::shared_ptr<file_pipeline>> {
        if (!shared_pipeline) {
            auto built = build_pipeline(stage, upload_file_names());
            if (!built) {
                return built;
            }
            shared_pipeline = built.value();
        }
        return shared_pipeline;
    }

    auto list_stage() -> result<std::vector<object_summary>> {
        auto active = pipeline();
        if (!active) {
            return unexpected{active.error()};
        }
        auto client = active.value()->client();
        retry_executor executor(settings.retry, token,
                                active.value()->settings().refresh_credentials);
        return executor.execute("list", [&] { return client->list(""); });
    }

    // ------------------------------------------------------------------------
    // Planning
    // ------------------------------------------------------------------------

    auto plan_uploads(transfer_report& report) -> result<std::vector<transfer_task>> {
        std::vector<std::filesystem::path> files;
        for (const auto& pattern : intent.local_paths) {
            auto matched = expand_local_pattern(pattern);
            if (!matched) {
                return unexpected{matched.error()};
            }
            if (matched.value().empty()) {
                return unexpected{error{error_code::local_file_not_found,
                    "no local file matches " + pattern}};
            }
            files.insert(files.end(), matched.value().begin(), matched.value().end());
        }

        const auto& destination = intent.options.destination_filename;
        if (destination && files.size() > 1) {
            return unexpected{error{error_code::invalid_parameter,
                "destination filename " + *destination + " given for " +
                std::to_string(files.size()) + " files"}};
        }

        std::vector<transfer_task> tasks;
        tasks.reserve(files.size());
        for (const auto& file : files) {
            auto task = file_pipeline::plan_upload(file, intent.options);
            if (!task) {
                transfer_task failed;
                failed.source = file.string();
                failed.name = file.filename().string();
                failed.target = failed.name;
                report.results.push_back(error_row(failed, task.error()));
                continue;
            }
            if (destination) {
                task.value().target = *destination;
            }
            tasks.push_back(std::move(task.value()));
        }
        return tasks;
    }

    auto plan_downloads() -> result<std::vector<transfer_task>> {
        std::optional<std::regex> filter;
        if (intent.options.pattern) {
            try {
                filter.emplace(*intent.options.pattern);
            } catch (const std::regex_error& e) {
                return unexpected{error{error_code::invalid_parameter,
                    "invalid pattern '" + *intent.options.pattern + "': " + e.what()}};
            }
        }

        std::vector<object_summary> objects;
        if (stage.is_presigned()) {
            for (const auto& name : stage.source_locations) {
                objects.push_back({name, 0});
            }
        } else {
            auto listed = list_stage();
            if (!listed) {
                return unexpected{listed.error()};
            }
            objects = std::move(listed.value());
        }

        std::vector<transfer_task> tasks;
        for (const auto& object : objects) {
            if (filter && !std::regex_match(object.key, *filter)) {
                continue;
            }
            transfer_task task;
            task.source = object.key;
            task.name = object.key;
            task.target = basename_of(object.key);
            task.size = object.size;
            if (intent.options.decompress && ends_with(task.target, compressed_suffix) &&
                task.target.size() > compressed_suffix.size()) {
                task.compress = true;
                task.target.resize(task.target.size() - compressed_suffix.size());
            }
            tasks.push_back(std::move(task));
        }
        return tasks;
    }

    /**
     * @brief Apply the name claims and the overwrite policy
     * @return Tasks to dispatch; skipped tasks are recorded in the report
     */
    auto filter_targets(std::vector<transfer_task> tasks, transfer_report& report)
        -> result<std::vector<transfer_task>> {
        std::set<std::string> existing;
        if (intent.is_upload() && !intent.options.overwrite && !stage.is_presigned() &&
            !tasks.empty()) {
            auto listed = list_stage();
            if (!listed) {
                return unexpected{listed.error()};
            }
            for (const auto& object : listed.value()) {
                existing.insert(object.key);
            }
        }

        std::set<std::string> claimed;
        std::vector<transfer_task> runnable;
        runnable.reserve(tasks.size());
        for (auto& task : tasks) {
            if (!claimed.insert(task.target).second) {
                report.results.push_back(skipped_row(task,
                    "target " + task.target + " is already claimed by another file"));
                continue;
            }
            if (existing.count(task.target) != 0) {
                report.results.push_back(skipped_row(task,
                    "target " + task.target + " already exists on the stage"));
                continue;
            }
            runnable.push_back(std::move(task));
        }
        return runnable;
    }

    // ------------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------------

    auto run_task(const transfer_task& task) -> transfer_result {
        std::shared_ptr<file_pipeline> active;
        if (stage.is_presigned()) {
            // A presigned URL names a single object
            std::vector<std::string> object_name{intent.is_upload() ? task.target : task.source};
            auto per_file = resolve(object_name);
            // Fails this file only; the others keep their own URLs
            if (!per_file) {
                return error_row(task, per_file.error());
            }
            auto built = build_pipeline(per_file.value(), std::move(object_name));
            if (!built) {
                return error_row(task, built.error());
            }
            active = built.value();
        } else {
            active = shared_pipeline;
        }

        if (intent.is_upload()) {
            return active->upload_file(task);
        }
        return active->download_object(task, intent.local_directory());
    }

    auto dispatch(std::vector<transfer_task> tasks, transfer_report& report) -> void {
        std::mutex results_mutex;
        auto record = [&](transfer_result row) {
            std::lock_guard lock(results_mutex);
            report.results.push_back(std::move(row));
        };

        auto pool = adapters::transfer_pool_factory::create(
            intent.options.parallel, "stage_transfer_" + intent.stage_name);

        std::vector<std::pair<const transfer_task*, std::future<void>>> in_flight;
        in_flight.reserve(tasks.size());
        for (const auto& task : tasks) {
            if (token->is_cancelled()) {
                record(error_row(task, error{error_code::cancelled, "transfer cancelled"}));
                continue;
            }
            in_flight.emplace_back(&task, pool->submit_to_stage(
                [this, &task, &record]() { record(run_task(task)); }, intent.stage_name));
        }

        for (auto& [task, future] : in_flight) {
            try {
                future.get();
            } catch (const std::exception& e) {
                record(error_row(*task, error{error_code::internal_error,
                    std::string("transfer task failed: ") + e.what()}));
            }
        }
    }
};

transfer_agent::transfer_agent(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

transfer_agent::~transfer_agent() = default;

auto transfer_agent::create(std::string_view command, transfer_context context)
    -> result<std::unique_ptr<transfer_agent>> {
    auto parsed = command_parser::parse(command, context.session);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    auto intent = std::move(parsed.value());
    if (context.destination_filename) {
        if (!intent.is_upload()) {
            return unexpected{error{error_code::invalid_parameter,
                "destination filename applies to PUT only"}};
        }
        intent.options.destination_filename = context.destination_filename;
    }

    auto state = std::make_unique<impl>(std::move(context), std::move(intent));

    auto stage = state->resolve(state->upload_file_names());
    if (!stage) {
        return unexpected{stage.error()};
    }
    state->stage = std::move(stage.value());

    ST_LOG_DEBUG(log_category::command,
        std::string(state->intent.is_upload() ? "PUT" : "GET") + " against @" +
        state->intent.stage_name + " on " + to_string(state->stage.kind) + ", parallel=" +
        std::to_string(state->intent.options.parallel));

    return std::unique_ptr<transfer_agent>(new transfer_agent(std::move(state)));
}

auto transfer_agent::execute() -> result<transfer_report> {
    const auto start = std::chrono::steady_clock::now();

    transfer_report report;
    report.direction = impl_->intent.direction;

    auto planned = impl_->intent.is_upload() ? impl_->plan_uploads(report)
                                             : impl_->plan_downloads();
    if (!planned) {
        ST_LOG_ERROR(log_category::agent, "Command aborted: " + describe(planned.error()));
        return unexpected{planned.error()};
    }

    auto runnable = impl_->filter_targets(std::move(planned.value()), report);
    if (!runnable) {
        ST_LOG_ERROR(log_category::agent, "Command aborted: " + describe(runnable.error()));
        return unexpected{runnable.error()};
    }

    // Workers share one pipeline, created before the first dispatch
    if (!impl_->stage.is_presigned() && !runnable.value().empty()) {
        auto shared = impl_->pipeline();
        if (!shared) {
            ST_LOG_ERROR(log_category::agent, "Command aborted: " + describe(shared.error()));
            return unexpected{shared.error()};
        }
    }

    ST_LOG_INFO(log_category::agent,
        "Transferring " + std::to_string(runnable.value().size()) + " files with @" +
        impl_->intent.stage_name + " (" + std::to_string(report.results.size()) +
        " settled before dispatch)");

    impl_->dispatch(std::move(runnable.value()), report);

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ST_LOG_INFO(log_category::agent,
        std::string(to_string(report.direction)) + " finished in " +
        std::to_string(report.elapsed.count()) + "ms: " +
        std::to_string(report.count(transfer_status::uploaded) +
                       report.count(transfer_status::downloaded)) + " transferred, " +
        std::to_string(report.count(transfer_status::skipped)) + " skipped, " +
        std::to_string(report.count(transfer_status::error)) + " failed");

    return report;
}

void transfer_agent::cancel() {
    if (!impl_->token->is_cancelled()) {
        ST_LOG_INFO(log_category::agent, "Cancelling transfer on @" + impl_->intent.stage_name);
    }
    impl_->token->cancel();
}

auto transfer_agent::is_cancelled() const -> bool {
    return impl_->token->is_cancelled();
}

auto transfer_agent::file_transfer_metadatas() const
    -> result<std::vector<file_transfer_metadata>> {
    if (!impl_->intent.is_upload()) {
        return unexpected{error{error_code::unsupported_operation,
            "file transfer metadata is only available for PUT"}};
    }

    std::vector<file_transfer_metadata> metadatas;
    if (!impl_->stage.is_presigned()) {
        metadatas.push_back(file_transfer_metadata::multi_file(impl_->stage,
                                                               impl_->intent.options));
        return metadatas;
    }

    for (const auto& pattern : impl_->intent.local_paths) {
        const auto name = basename_of(pattern);
        auto per_file = impl_->resolve({name});
        if (!per_file) {
            return unexpected{per_file.error()};
        }
        metadatas.push_back(file_transfer_metadata::single_file(
            std::move(per_file.value()), impl_->intent.options, name));
    }
    return metadatas;
}

auto transfer_agent::intent() const -> const transfer_intent& {
    return impl_->intent;
}

auto transfer_agent::stage() const -> const stage_info& {
    return impl_->stage;
}

auto run_transfer_command(std::string_view command, transfer_context context)
    -> result<transfer_report> {
    auto agent = transfer_agent::create(command, std::move(context));
    if (!agent) {
        return unexpected{agent.error()};
    }
    auto report = agent.value()->execute();
    if (!report) {
        return report;
    }
    auto status = result_reporter::check(report.value());
    if (!status) {
        return unexpected{status.error()};
    }
    return report;
}

}  // namespace kcenon::stage_transfer
