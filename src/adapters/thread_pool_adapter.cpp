// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for chunk units
 */

#include "kcenon/blob_upload/adapters/thread_pool_adapter.h"

#include "kcenon/blob_upload/core/logging.h"

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

#include <atomic>
#include <exception>

namespace kcenon::blob_upload::adapters {

namespace {

auto resolve_worker_count(std::size_t requested) -> std::size_t {
    if (requested != 0) {
        return requested;
    }
    auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hw == 0 ? 4 : hw;
}

}  // namespace

// ============================================================================
// thread_system_chunk_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Wraps one chunk unit as a thread_system job
 */
class chunk_job : public kcenon::thread::job {
public:
    explicit chunk_job(std::function<void()> func) : job("chunk_unit"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_chunk_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t worker_count{0};
    std::atomic<bool> running{true};
};

thread_system_chunk_pool::thread_system_chunk_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_chunk_pool::~thread_system_chunk_pool() {
    shutdown();
}

auto thread_system_chunk_pool::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<thread_system_chunk_pool> {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_chunk_pool>(std::move(pool), worker_count);
}

auto thread_system_chunk_pool::submit(std::function<void()> task) -> result<void> {
    if (!pimpl_->running.load()) {
        return unexpected{error{error_code::pool_stopped, "chunk pool is shut down"}};
    }

    auto enqueue_result = pimpl_->pool->enqueue(std::make_unique<chunk_job>(std::move(task)));
    if (!enqueue_result.is_ok()) {
        return unexpected{error{error_code::schedule_rejected,
                                "thread pool rejected chunk unit"}};
    }
    return {};
}

auto thread_system_chunk_pool::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_chunk_pool::is_running() const -> bool {
    return pimpl_->running.load();
}

auto thread_system_chunk_pool::pending_tasks() const -> std::size_t {
    auto queue = pimpl_->pool ? pimpl_->pool->get_job_queue() : nullptr;
    return queue ? queue->size() : 0;
}

void thread_system_chunk_pool::shutdown() {
    if (pimpl_ && pimpl_->running.exchange(false) && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// fixed_chunk_pool
// ============================================================================

struct fixed_chunk_pool::state {
    explicit state(std::size_t queue_capacity)
        : capacity(queue_capacity == 0 ? 1 : queue_capacity) {}

    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<std::function<void()>> queue;
    std::size_t capacity;
    bool stopping = false;
};

fixed_chunk_pool::fixed_chunk_pool(std::size_t worker_count, std::size_t queue_capacity)
    : state_(std::make_shared<state>(queue_capacity)) {
    worker_count = resolve_worker_count(worker_count);
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([shared = state_] { worker_loop(shared); });
    }
}

fixed_chunk_pool::~fixed_chunk_pool() {
    shutdown();
}

auto fixed_chunk_pool::submit(std::function<void()> task) -> result<void> {
    {
        std::unique_lock lock(state_->mutex);
        state_->not_full.wait(lock, [this] {
            return state_->stopping || state_->queue.size() < state_->capacity;
        });
        if (state_->stopping) {
            return unexpected{error{error_code::pool_stopped, "chunk pool is shut down"}};
        }
        state_->queue.push_back(std::move(task));
    }
    state_->not_empty.notify_one();
    return {};
}

auto fixed_chunk_pool::worker_count() const -> std::size_t {
    return workers_.size();
}

auto fixed_chunk_pool::is_running() const -> bool {
    std::lock_guard lock(state_->mutex);
    return !state_->stopping;
}

auto fixed_chunk_pool::pending_tasks() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->queue.size();
}

void fixed_chunk_pool::shutdown() {
    {
        std::lock_guard lock(state_->mutex);
        if (state_->stopping && workers_.empty()) {
            return;
        }
        state_->stopping = true;
    }
    state_->not_empty.notify_all();
    state_->not_full.notify_all();

    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            // Released from inside a unit; this worker drains through state.
            worker.detach();
        } else {
            worker.join();
        }
    }
    workers_.clear();
}

void fixed_chunk_pool::worker_loop(const std::shared_ptr<state>& shared) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(shared->mutex);
            shared->not_empty.wait(lock,
                                   [&shared] { return shared->stopping || !shared->queue.empty(); });
            if (shared->queue.empty()) {
                return;
            }
            task = std::move(shared->queue.front());
            shared->queue.pop_front();
        }
        shared->not_full.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            BU_LOG_ERROR(log_category::engine,
                         std::string("chunk unit threw: ") + e.what());
        }
    }
}

// ============================================================================
// chunk_pool_factory
// ============================================================================

auto chunk_pool_factory::create(std::size_t worker_count, std::size_t queue_capacity)
    -> std::shared_ptr<chunk_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    (void)queue_capacity;
    return thread_system_chunk_pool::create(worker_count);
#else
    return std::make_shared<fixed_chunk_pool>(worker_count, queue_capacity);
#endif
}

}  // namespace kcenon::blob_upload::adapters
