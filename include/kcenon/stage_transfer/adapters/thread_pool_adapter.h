// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for per-file transfer tasks
 *
 * A command dispatches its files through one pool of `parallel` workers.
 * The pool runs on thread_system when it is available and on a fixed set
 * of std::thread workers otherwise.
 *
 * Features:
 * - Bounded concurrency: at most worker_count() tasks run at once
 * - Stage-based task tracking ("upload", "download", "multipart")
 * - Futures that carry task exceptions back to the caller
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::stage_transfer::adapters {

/**
 * @brief Worker pool of one transfer command
 *
 * Every future returned by submit() or submit_to_stage() is fulfilled when
 * its task returns, or holds the exception the task threw.
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Like submit(), and counted in pending_tasks(stage_name) until done
     */
    virtual std::future<void> submit_to_stage(std::function<void()> task,
                                              const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Submitted and not yet finished
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

/**
 * @brief std::thread workers draining one FIFO queue
 *
 * Submitting after shutdown() yields a future holding std::runtime_error.
 * The destructor runs everything still queued before joining.
 */
class fixed_transfer_pool : public transfer_thread_pool_interface {
public:
    /**
     * @param worker_count Number of workers (0 = hardware concurrency)
     * @param pool_name Name used in log messages
     */
    explicit fixed_transfer_pool(size_t worker_count,
                                 const std::string& pool_name = "stage_transfer_pool");
    ~fixed_transfer_pool() override;

    fixed_transfer_pool(const fixed_transfer_pool&) = delete;
    fixed_transfer_pool& operator=(const fixed_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /// Most tasks seen running at once since construction
    [[nodiscard]] size_t peak_concurrency() const;

    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Transfer tasks as jobs on a kcenon::thread::thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @param pool Started thread_system pool
     * @param pool_name Prefix of job names and log messages
     * @param worker_count Reported by worker_count()
     */
    explicit thread_system_transfer_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                            const std::string& pool_name = "stage_transfer_pool",
                                            size_t worker_count = 0);
    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Build and start a pool of worker_count thread_workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0, const std::string& pool_name = "stage_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool for a command: thread_system when built with it, else fixed_transfer_pool
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count, const std::string& pool_name = "stage_transfer_pool");
};

}  // namespace kcenon::stage_transfer::adapters
