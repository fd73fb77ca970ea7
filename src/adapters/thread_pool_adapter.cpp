// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for stage transfers
 */

#include "kcenon/stage_transfer/adapters/thread_pool_adapter.h"

#include "kcenon/stage_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::stage_transfer::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Wrap a task so its outcome, exception included, reaches the future
 */
auto bind_promise(std::function<void()> task, std::shared_ptr<std::promise<void>> promise)
    -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
}

/**
 * @brief Count a task under @p stage until it finishes, thrown or not
 */
auto track_stage(std::function<void()> task, stage_tracker* tracker, std::string stage)
    -> std::function<void()> {
    tracker->increment(stage);
    return [task = std::move(task), tracker, stage = std::move(stage)]() {
        struct release_on_exit {
            stage_tracker* owner;
            const std::string& name;
            ~release_on_exit() { owner->decrement(name); }
        } release{tracker, stage};
        task();
    };
}

}  // namespace

// ============================================================================
// fixed_transfer_pool implementation
// ============================================================================

struct fixed_transfer_pool::impl {
    std::string pool_name;
    size_t worker_count{0};
    std::vector<std::thread> workers;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    bool stopping{false};

    std::atomic<size_t> pending{0};
    std::atomic<size_t> running{0};
    std::atomic<size_t> peak{0};
    stage_tracker tracker;

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }

            const auto now_running = running.fetch_add(1) + 1;
            auto observed = peak.load();
            while (now_running > observed && !peak.compare_exchange_weak(observed, now_running)) {
            }

            task();

            running.fetch_sub(1);
            pending.fetch_sub(1);
        }
    }

    std::future<void> enqueue(std::function<void()> task) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        pending.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                pending.fetch_sub(1);
                promise->set_exception(std::make_exception_ptr(
                    std::runtime_error(pool_name + " is shut down")));
                return future;
            }
            queue.push_back(bind_promise(std::move(task), promise));
        }
        cv.notify_one();
        return future;
    }
};

fixed_transfer_pool::fixed_transfer_pool(size_t worker_count, const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(pimpl_->worker_count);
    for (size_t i = 0; i < pimpl_->worker_count; ++i) {
        pimpl_->workers.emplace_back([this] { pimpl_->worker_loop(); });
    }
    ST_LOG_DEBUG(log_category::pool,
        "Started " + pool_name + " with " + std::to_string(pimpl_->worker_count) + " workers");
}

fixed_transfer_pool::~fixed_transfer_pool() {
    shutdown();
}

void fixed_transfer_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping && pimpl_->workers.empty()) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    pimpl_->workers.clear();
}

std::future<void> fixed_transfer_pool::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task));
}

std::future<void> fixed_transfer_pool::submit_to_stage(std::function<void()> task,
                                                       const std::string& stage_name) {
    return pimpl_->enqueue(track_stage(std::move(task), &pimpl_->tracker, stage_name));
}

size_t fixed_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool fixed_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t fixed_transfer_pool::pending_tasks() const {
    return pimpl_->pending.load();
}

size_t fixed_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

size_t fixed_transfer_pool::peak_concurrency() const {
    return pimpl_->peak.load();
}

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief thread_system job running one transfer task
 */
class transfer_job : public kcenon::thread::job {
public:
    transfer_job(std::function<void()> body, std::string label)
        : job(std::move(label)), body_(std::move(body)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        body_();
        return common::ok();
    }

private:
    std::function<void()> body_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string name;
    size_t workers{0};
    stage_tracker tracker;

    auto enqueue(std::function<void()> task, std::string label) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        pool->enqueue(std::make_unique<transfer_job>(
            bind_promise(std::move(task), std::move(promise)), std::move(label)));
        return future;
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->name = pool_name;
    pimpl_->workers = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    const auto workers = resolve_worker_count(worker_count);
    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t n = 0; n < workers; ++n) {
        auto thread_worker = std::make_unique<kcenon::thread::thread_worker>();
        thread_worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(thread_worker));
    }
    pool->start();

    ST_LOG_DEBUG(log_category::pool,
        "Started thread_system pool " + pool_name + " with " +
        std::to_string(workers) + " workers");

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name, workers);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), pimpl_->name + ".task");
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    return pimpl_->enqueue(track_stage(std::move(task), &pimpl_->tracker, stage_name),
                           pimpl_->name + "." + stage_name);
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->workers;
}

bool thread_system_transfer_adapter::is_running() const {
    return static_cast<bool>(pimpl_->pool);
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (!pimpl_->pool) {
        return 0;
    }
    const auto jobs = pimpl_->pool->get_job_queue();
    return jobs ? jobs->size() : 0;
}

size_t thread_system_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<fixed_transfer_pool>(worker_count, pool_name);
#endif
}

}  // namespace kcenon::stage_transfer::adapters
