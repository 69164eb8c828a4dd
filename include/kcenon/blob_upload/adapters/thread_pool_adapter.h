// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool executing chunk units
 *
 * The scheduler only enqueues; it never waits for a chunk. Two backends:
 * - thread_system's thread_pool when built with KCENON_WITH_THREAD_SYSTEM
 * - fixed_chunk_pool, a bounded queue with a fixed set of std::threads
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config/feature_flags.h"
#include "../core/types.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_upload::adapters {

/**
 * @brief Pool accepting independent chunk units
 */
class chunk_pool_interface {
public:
    virtual ~chunk_pool_interface() = default;

    /**
     * @brief Enqueue a unit; may block while the queue is full
     * @return pool_stopped or schedule_rejected if the unit was not accepted
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task) -> result<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto is_running() const -> bool = 0;
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;

    /**
     * @brief Stop accepting units, drain the queue and join the workers
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief chunk_pool_interface over thread_system's thread_pool
 */
class thread_system_chunk_pool : public chunk_pool_interface {
public:
    explicit thread_system_chunk_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                      std::size_t worker_count);
    ~thread_system_chunk_pool() override;

    thread_system_chunk_pool(const thread_system_chunk_pool&) = delete;
    auto operator=(const thread_system_chunk_pool&) -> thread_system_chunk_pool& = delete;

    /**
     * @brief Create a started pool with worker_count workers
     */
    [[nodiscard]] static auto create(std::size_t worker_count,
                                     const std::string& pool_name = "blob_upload_pool")
        -> std::shared_ptr<thread_system_chunk_pool>;

    [[nodiscard]] auto submit(std::function<void()> task) -> result<void> override;
    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed set of worker threads draining a bounded queue
 *
 * submit() blocks while the queue holds queue_capacity units. Units still
 * queued at shutdown() are run before the workers exit. The pool may be
 * destroyed from one of its own units: that worker is detached and finishes
 * the queue on its own.
 */
class fixed_chunk_pool : public chunk_pool_interface {
public:
    fixed_chunk_pool(std::size_t worker_count, std::size_t queue_capacity);
    ~fixed_chunk_pool() override;

    fixed_chunk_pool(const fixed_chunk_pool&) = delete;
    auto operator=(const fixed_chunk_pool&) -> fixed_chunk_pool& = delete;

    [[nodiscard]] auto submit(std::function<void()> task) -> result<void> override;
    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    void shutdown() override;

private:
    struct state;

    static void worker_loop(const std::shared_ptr<state>& shared);

    std::shared_ptr<state> state_;
    std::vector<std::thread> workers_;
};

/**
 * @brief Picks the pool implementation
 *
 * 1. thread_system_chunk_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. fixed_chunk_pool
 */
class chunk_pool_factory {
public:
    /**
     * @param worker_count Workers (0 = hardware concurrency)
     * @param queue_capacity Bound of the fallback queue
     */
    [[nodiscard]] static auto create(std::size_t worker_count, std::size_t queue_capacity)
        -> std::shared_ptr<chunk_pool_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_upload::adapters
