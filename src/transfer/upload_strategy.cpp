/**
 * @file upload_strategy.cpp
 * @brief Chunk workers for whole-object, block-list and page-range uploads
 * @version 0.1.0
 */

#include "kcenon/blob_upload/transfer/upload_strategy.h"

#include "kcenon/blob_upload/cloud/cloud_utils.h"
#include "kcenon/blob_upload/core/zero_scan.h"

#include <exception>
#include <string>

namespace kcenon::blob_upload {

namespace {

auto chunk_name(const chunk_descriptor& chunk) -> std::string {
    return "chunk " + std::to_string(chunk.index) + " [" + std::to_string(chunk.offset) + ", " +
           std::to_string(chunk.end()) + ")";
}

}  // namespace

// ============================================================================
// upload_strategy
// ============================================================================

upload_strategy::upload_strategy(upload_session session) : session_(std::move(session)) {}

void upload_strategy::run_chunk(const chunk_descriptor& chunk) {
    auto& manager = *session_.manager;
    manager.occupy_connection();

    if (manager.was_cancelled()) {
        auto ctx = chunk_context(chunk);
        BU_LOG_DEBUG_CTX(log_category::chunk, "chunk skipped: transfer cancelled", ctx);
    } else {
        auto written = write_guarded(chunk);
        if (!written) {
            on_chunk_failure(chunk, written.error());
        }
    }

    manager.add_bytes_done(chunk.length);
    manager.release_connection();

    bool is_last = counts_chunks() ? manager.report_chunk_done().is_last : true;
    if (is_last) {
        epilogue();
    }
}

void upload_strategy::abort(transfer_status status, const error& cause) {
    auto& manager = *session_.manager;
    manager.set_status(status);
    manager.log_upload_error(cause.message, cause.status_code);
    manager.add_bytes_done(session_.plan.source_size);
    conclude();
}

auto upload_strategy::write_guarded(const chunk_descriptor& chunk) -> result<void> {
    try {
        return write_chunk(chunk);
    } catch (const std::exception& e) {
        return unexpected{error{error_code::internal_error,
                                chunk_name(chunk) + " threw: " + e.what()}};
    }
}

void upload_strategy::on_chunk_failure(const chunk_descriptor& chunk, const error& cause) {
    auto& manager = *session_.manager;
    if (cause.code == error_code::transfer_cancelled) {
        auto ctx = chunk_context(chunk);
        ctx.error_message = cause.message;
        BU_LOG_DEBUG_CTX(log_category::chunk, "chunk abandoned after cancellation", ctx);
        return;
    }
    if (manager.was_cancelled()) {
        // Outcome is already decided; keep the remote detail.
        manager.log_upload_error(chunk_name(chunk) + ": " + cause.message, cause.status_code);
        return;
    }
    fail(chunk_name(chunk), cause);
}

void upload_strategy::fail(std::string_view what, const error& cause) {
    auto& manager = *session_.manager;
    manager.set_status(transfer_status::failed);
    manager.cancel();
    manager.log_upload_error(std::string(what) + ": " + cause.message, cause.status_code);
}

void upload_strategy::epilogue() {
    auto& manager = *session_.manager;
    if (!manager.was_cancelled() && !is_failure(manager.status())) {
        finalize();
    }
    conclude();
}

void upload_strategy::conclude() {
    auto& manager = *session_.manager;
    if (manager.status() == transfer_status::in_progress && manager.was_cancelled()) {
        manager.set_status(transfer_status::cancelled);
    }

    if (session_.mapping) {
        session_.mapping->release();
    }

    auto final_status = manager.status();
    if (should_delete_destination(final_status)) {
        delete_destination();
    }

    manager.report_transfer_done();
}

void upload_strategy::delete_destination() {
    auto deleted = session_.destination->delete_blob(cancellation_token::none());
    if (deleted) {
        BU_LOG_INFO(log_category::cleanup, "removed partial blob " + session_.destination->name());
        return;
    }
    if (deleted.error().is_not_found()) {
        BU_LOG_DEBUG(log_category::cleanup,
                     "nothing to remove at " + session_.destination->name());
        return;
    }
    BU_LOG_WARN(log_category::cleanup, "could not remove " + session_.destination->name() +
                                           ": " + deleted.error().message);
}

auto upload_strategy::chunk_body(const chunk_descriptor& chunk)
    -> result<std::unique_ptr<body_stream>> {
    if (!session_.mapping) {
        if (chunk.length != 0) {
            return unexpected{error{error_code::source_range_error,
                                    chunk_name(chunk) + " has no mapped source"}};
        }
        return std::unique_ptr<body_stream>(std::make_unique<memory_body_stream>());
    }

    auto slice = session_.mapping->slice(chunk.offset, chunk.length);
    if (!slice) {
        return unexpected{slice.error()};
    }
    return make_paced_body(slice.value(), session_.limiter, session_.manager->context());
}

auto upload_strategy::apply_tier(std::string_view tier) -> bool {
    auto& manager = *session_.manager;
    auto tiered = session_.destination->set_tier(tier, manager.context());
    if (!tiered) {
        manager.set_status(transfer_status::tier_set_failure);
        manager.log_upload_error("setting tier " + std::string(tier) + ": " +
                                     tiered.error().message,
                                 tiered.error().status_code);
        return false;
    }
    return true;
}

auto upload_strategy::chunk_context(const chunk_descriptor& chunk) const
    -> transfer_log_context {
    const auto& info = session_.manager->info();
    transfer_log_context ctx;
    ctx.source = info.source.string();
    ctx.destination = info.destination;
    ctx.chunk_index = chunk.index;
    ctx.total_chunks = session_.plan.chunk_count;
    ctx.bytes = chunk.length;
    return ctx;
}

// ============================================================================
// put_blob_strategy
// ============================================================================

auto put_blob_strategy::write_chunk(const chunk_descriptor& chunk) -> result<void> {
    auto body = chunk_body(chunk);
    if (!body) {
        return unexpected{body.error()};
    }
    return session_.destination->upload(*body.value(), session_.properties.headers,
                                        session_.properties.metadata,
                                        session_.manager->context());
}

void put_blob_strategy::finalize() {
    auto tier = session_.manager->tier_settings().block;
    if (tier != block_blob_tier::none && !apply_tier(to_string(tier))) {
        return;
    }
    session_.manager->set_status(transfer_status::success);
}

auto put_blob_strategy::should_delete_destination(transfer_status status) const -> bool {
    // A failed Put Blob leaves nothing behind; only a blob with the wrong tier does.
    return status == transfer_status::tier_set_failure;
}

// ============================================================================
// block_blob_strategy
// ============================================================================

block_blob_strategy::block_blob_strategy(upload_session session)
    : upload_strategy(std::move(session)), table_(session_.plan.chunk_count) {}

auto block_blob_strategy::write_chunk(const chunk_descriptor& chunk) -> result<void> {
    auto block_id = cloud_utils::make_block_id();
    table_.set(chunk.index, block_id);

    auto body = chunk_body(chunk);
    if (!body) {
        return unexpected{body.error()};
    }
    return session_.destination->stage_block(block_id, *body.value(),
                                             session_.manager->context());
}

void block_blob_strategy::finalize() {
    auto& manager = *session_.manager;

    if (!table_.is_complete()) {
        BU_LOG_FATAL(log_category::epilogue,
                     "block list has unfilled slots for " + manager.info().destination);
        manager.set_status(transfer_status::failed);
        return;
    }

    auto committed = session_.destination->commit_block_list(
        table_.ids(), session_.properties.headers, session_.properties.metadata,
        manager.context());
    if (!committed) {
        fail("commit block list", committed.error());
        return;
    }

    BU_LOG_DEBUG(log_category::epilogue,
                 "committed " + std::to_string(table_.size()) + " blocks to " +
                     manager.info().destination);

    auto tier = manager.tier_settings().block;
    if (tier != block_blob_tier::none && !apply_tier(to_string(tier))) {
        return;
    }
    manager.set_status(transfer_status::success);
}

auto block_blob_strategy::should_delete_destination(transfer_status status) const -> bool {
    return is_failure(status);
}

// ============================================================================
// page_blob_strategy
// ============================================================================

auto page_blob_strategy::prepare() -> result<void> {
    auto& manager = *session_.manager;

    auto created = session_.destination->create_page_blob(
        session_.plan.source_size, session_.properties.headers, session_.properties.metadata,
        manager.context());
    if (!created) {
        return created;
    }
    created_.store(true, std::memory_order_release);

    auto tier = manager.tier_settings().page;
    if (tier != page_blob_tier::none) {
        auto tiered = session_.destination->set_tier(to_string(tier), manager.context());
        if (!tiered) {
            manager.set_status(transfer_status::tier_set_failure);
            return tiered;
        }
    }
    return {};
}

auto page_blob_strategy::write_chunk(const chunk_descriptor& chunk) -> result<void> {
    if (!session_.mapping) {
        return unexpected{error{error_code::source_range_error,
                                chunk_name(chunk) + " has no mapped source"}};
    }
    auto slice = session_.mapping->slice(chunk.offset, chunk.length);
    if (!slice) {
        return unexpected{slice.error()};
    }

    // Unwritten pages of a page blob already read as zero.
    if (is_all_zero(slice.value())) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        BU_LOG_TRACE(log_category::chunk, "zero range not sent: " + chunk_name(chunk));
        return {};
    }

    auto body = make_paced_body(slice.value(), session_.limiter, session_.manager->context());
    return session_.destination->upload_pages(chunk.offset, *body,
                                              session_.manager->context());
}

void page_blob_strategy::finalize() {
    session_.manager->set_status(transfer_status::success);
}

auto page_blob_strategy::should_delete_destination(transfer_status status) const -> bool {
    return created_.load(std::memory_order_acquire) && is_failure(status);
}

// ============================================================================
// Factory
// ============================================================================

auto make_upload_strategy(upload_session session) -> std::shared_ptr<upload_strategy> {
    switch (session.plan.kind) {
        case plan_kind::block_list:
            return std::make_shared<block_blob_strategy>(std::move(session));
        case plan_kind::page_range:
            return std::make_shared<page_blob_strategy>(std::move(session));
        case plan_kind::whole_object:
        default:
            return std::make_shared<put_blob_strategy>(std::move(session));
    }
}

}  // namespace kcenon::blob_upload
