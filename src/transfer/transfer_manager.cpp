/**
 * @file transfer_manager.cpp
 * @brief In-process transfer_manager_interface implementation
 * @version 0.1.0
 */

#include "kcenon/blob_upload/transfer/transfer_manager.h"

#include "kcenon/blob_upload/cloud/cloud_utils.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

namespace kcenon::blob_upload {

struct transfer_manager::impl {
    transfer_info info;
    std::shared_ptr<adapters::chunk_pool_interface> pool;
    done_callback on_done;

    cancellation_source cancel_source;
    completion_coordinator coordinator;

    std::atomic<transfer_status> status{transfer_status::in_progress};
    std::atomic<uint64_t> bytes_done{0};
    std::atomic<uint32_t> done_count{0};
    std::atomic<uint32_t> active_connections{0};
    std::atomic<uint32_t> peak_connections{0};

    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;

    [[nodiscard]] auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.source = info.source.string();
        ctx.destination = info.destination;
        ctx.source_size = info.source_size;
        return ctx;
    }
};

transfer_manager::transfer_manager(transfer_info info,
                                   std::shared_ptr<adapters::chunk_pool_interface> pool,
                                   done_callback on_done)
    : impl_(std::make_unique<impl>()) {
    impl_->info = std::move(info);
    impl_->pool = std::move(pool);
    impl_->on_done = std::move(on_done);
}

transfer_manager::~transfer_manager() = default;

auto transfer_manager::info() const -> const transfer_info& {
    return impl_->info;
}

auto transfer_manager::was_cancelled() const -> bool {
    return impl_->cancel_source.is_cancelled();
}

void transfer_manager::cancel() {
    if (impl_->cancel_source.cancel()) {
        BU_LOG_DEBUG(log_category::engine, "transfer cancelled: " + impl_->info.destination);
    }
}

auto transfer_manager::context() const -> cancellation_token {
    return impl_->cancel_source.token();
}

void transfer_manager::set_status(transfer_status status) {
    auto current = impl_->status.load(std::memory_order_acquire);
    while (!is_failure(current)) {
        if (status == transfer_status::in_progress) {
            return;
        }
        if (impl_->status.compare_exchange_weak(current, status, std::memory_order_acq_rel)) {
            return;
        }
    }
}

auto transfer_manager::status() const -> transfer_status {
    return impl_->status.load(std::memory_order_acquire);
}

void transfer_manager::add_bytes_done(uint64_t bytes) {
    impl_->bytes_done.fetch_add(bytes, std::memory_order_relaxed);
}

void transfer_manager::set_number_of_chunks(uint32_t count) {
    impl_->coordinator.set_total(count);
}

auto transfer_manager::report_chunk_done() -> chunk_completion {
    return impl_->coordinator.report_chunk_done();
}

void transfer_manager::report_transfer_done() {
    auto previous = impl_->done_count.fetch_add(1, std::memory_order_acq_rel);
    if (previous != 0) {
        BU_LOG_ERROR(log_category::engine,
                     "transfer reported done more than once: " + impl_->info.destination);
        return;
    }

    auto final_status = status();
    auto ctx = impl_->log_context();
    ctx.bytes = bytes_done();
    BU_LOG_INFO_CTX(log_category::engine,
                    "transfer done: " + std::string(to_string(final_status)), ctx);

    if (impl_->on_done) {
        impl_->on_done(final_status);
    }

    {
        std::lock_guard<std::mutex> lock(impl_->done_mutex);
        impl_->done = true;
    }
    impl_->done_cv.notify_all();
}

void transfer_manager::schedule_chunk(chunk_unit unit) {
    if (!impl_->pool) {
        unit();
        return;
    }

    auto submitted = impl_->pool->submit(unit);
    if (!submitted) {
        // The unit still has to run so the completion counter reaches its total.
        auto ctx = impl_->log_context();
        ctx.error_message = submitted.error().message;
        BU_LOG_ERROR_CTX(log_category::engine, "chunk could not be scheduled", ctx);
        set_status(transfer_status::failed);
        cancel();
        unit();
    }
}

auto transfer_manager::destination_headers_and_metadata(const source_mapping* mapping) const
    -> destination_data {
    destination_data data;
    data.headers = impl_->info.headers;
    data.metadata = impl_->info.metadata;

    if (data.headers.content_type.empty() && !impl_->info.no_guess_mime_type) {
        data.headers.content_type = cloud_utils::detect_content_type(impl_->info.source.string());
    }

    if (impl_->info.put_md5 && mapping != nullptr && !mapping->is_released()) {
        auto digest = cloud_utils::md5(mapping->bytes());
        if (!digest.empty()) {
            data.headers.content_md5 = cloud_utils::base64_encode(digest);
        }
    }

    return data;
}

auto transfer_manager::tier_settings() const -> blob_tiers {
    return impl_->info.tiers;
}

auto transfer_manager::should_log(log_level level) const -> bool {
    return get_logger().is_enabled(level);
}

void transfer_manager::log(log_level level, std::string_view message) {
    if (!should_log(level)) {
        return;
    }
    auto ctx = impl_->log_context();
    BU_LOG_CTX(level, log_category::engine, message, ctx);
}

void transfer_manager::log_upload_error(std::string_view message, int status_code) {
    auto ctx = impl_->log_context();
    ctx.error_message = std::string(message);
    if (status_code != 0) {
        ctx.status_code = status_code;
    }
    BU_LOG_ERROR_CTX(log_category::engine, "upload failed", ctx);
}

void transfer_manager::occupy_connection() {
    auto now = impl_->active_connections.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto peak = impl_->peak_connections.load(std::memory_order_relaxed);
    while (now > peak &&
           !impl_->peak_connections.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }
}

void transfer_manager::release_connection() {
    impl_->active_connections.fetch_sub(1, std::memory_order_acq_rel);
}

auto transfer_manager::bytes_done() const -> uint64_t {
    return impl_->bytes_done.load(std::memory_order_relaxed);
}

auto transfer_manager::number_of_chunks() const -> uint32_t {
    return impl_->coordinator.total();
}

auto transfer_manager::chunks_done() const -> uint32_t {
    return impl_->coordinator.chunks_done();
}

auto transfer_manager::done_count() const -> uint32_t {
    return impl_->done_count.load(std::memory_order_acquire);
}

auto transfer_manager::is_done() const -> bool {
    return done_count() > 0;
}

auto transfer_manager::active_connections() const -> uint32_t {
    return impl_->active_connections.load(std::memory_order_acquire);
}

auto transfer_manager::peak_connections() const -> uint32_t {
    return impl_->peak_connections.load(std::memory_order_relaxed);
}

auto transfer_manager::wait() -> transfer_status {
    std::unique_lock<std::mutex> lock(impl_->done_mutex);
    impl_->done_cv.wait(lock, [this] { return impl_->done; });
    return status();
}

auto transfer_manager::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(impl_->done_mutex);
    return impl_->done_cv.wait_for(lock, timeout, [this] { return impl_->done; });
}

}  // namespace kcenon::blob_upload
