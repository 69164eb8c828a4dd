/**
 * @file upload_strategy.h
 * @brief Chunk workers for whole-object, block-list and page-range uploads
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_STRATEGY_H
#define KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_STRATEGY_H

#include "transfer_manager_interface.h"

#include "kcenon/blob_upload/cloud/blob_destination.h"
#include "kcenon/blob_upload/core/block_id_table.h"
#include "kcenon/blob_upload/core/chunk_planner.h"
#include "kcenon/blob_upload/core/pacer.h"
#include "kcenon/blob_upload/core/source_mapping.h"

#include <atomic>
#include <memory>

namespace kcenon::blob_upload {

/**
 * @brief Everything a strategy needs for one transfer
 */
struct upload_session {
    std::shared_ptr<transfer_manager_interface> manager;
    std::shared_ptr<blob_destination> destination;

    /// Shared rate limiter; null means unlimited
    std::shared_ptr<pacer> limiter;

    upload_plan plan;

    /// Mapped source; null for an empty source
    std::shared_ptr<source_mapping> mapping;

    destination_data properties;
};

/**
 * @brief Per-chunk shell shared by every upload kind
 *
 * run_chunk() is the unit scheduled on the pool. Each call accounts the
 * chunk's bytes exactly once, then asks the completion counter whether it
 * was the last; the single caller that was runs the epilogue, releases the
 * mapping and reports the transfer done.
 */
class upload_strategy {
public:
    explicit upload_strategy(upload_session session);
    virtual ~upload_strategy() = default;

    upload_strategy(const upload_strategy&) = delete;
    auto operator=(const upload_strategy&) -> upload_strategy& = delete;

    [[nodiscard]] virtual auto kind() const noexcept -> plan_kind = 0;

    /**
     * @brief Remote setup before any chunk is scheduled
     */
    [[nodiscard]] virtual auto prepare() -> result<void> { return {}; }

    /**
     * @brief Whether completion is tracked with the chunk counter
     */
    [[nodiscard]] virtual auto counts_chunks() const noexcept -> bool { return true; }

    /**
     * @brief Execute one chunk end to end
     */
    void run_chunk(const chunk_descriptor& chunk);

    /**
     * @brief Terminate a transfer whose chunks were never scheduled
     */
    void abort(transfer_status status, const error& cause);

    [[nodiscard]] auto session() const noexcept -> const upload_session& { return session_; }

protected:
    [[nodiscard]] virtual auto write_chunk(const chunk_descriptor& chunk) -> result<void> = 0;

    /**
     * @brief Commit or finalize; runs only when no chunk failed
     *
     * Sets the final status.
     */
    virtual void finalize() = 0;

    /**
     * @brief Whether the remote blob must be removed for this final status
     */
    [[nodiscard]] virtual auto should_delete_destination(transfer_status status) const
        -> bool = 0;

    /**
     * @brief Paced body over a chunk of the mapped source
     */
    [[nodiscard]] auto chunk_body(const chunk_descriptor& chunk)
        -> result<std::unique_ptr<body_stream>>;

    /**
     * @brief Apply a tier after the data has landed
     * @return false if the tier could not be set (status TierSetFailure)
     */
    auto apply_tier(std::string_view tier) -> bool;

    void fail(std::string_view what, const error& cause);

    [[nodiscard]] auto chunk_context(const chunk_descriptor& chunk) const
        -> transfer_log_context;

    upload_session session_;

private:
    [[nodiscard]] auto write_guarded(const chunk_descriptor& chunk) -> result<void>;
    void on_chunk_failure(const chunk_descriptor& chunk, const error& cause);
    void epilogue();
    void conclude();
    void delete_destination();
};

/**
 * @brief Single Put Blob of the whole source; no counter, no block table
 */
class put_blob_strategy : public upload_strategy {
public:
    using upload_strategy::upload_strategy;

    [[nodiscard]] auto kind() const noexcept -> plan_kind override {
        return plan_kind::whole_object;
    }
    [[nodiscard]] auto counts_chunks() const noexcept -> bool override { return false; }

protected:
    [[nodiscard]] auto write_chunk(const chunk_descriptor& chunk) -> result<void> override;
    void finalize() override;
    [[nodiscard]] auto should_delete_destination(transfer_status status) const
        -> bool override;
};

/**
 * @brief Staged blocks committed as one block list by the last chunk
 */
class block_blob_strategy : public upload_strategy {
public:
    explicit block_blob_strategy(upload_session session);

    [[nodiscard]] auto kind() const noexcept -> plan_kind override {
        return plan_kind::block_list;
    }

    [[nodiscard]] auto block_ids() const noexcept -> const block_id_table& { return table_; }

protected:
    [[nodiscard]] auto write_chunk(const chunk_descriptor& chunk) -> result<void> override;
    void finalize() override;
    [[nodiscard]] auto should_delete_destination(transfer_status status) const
        -> bool override;

private:
    // Slot i is written only by the worker running chunk i.
    block_id_table table_;
};

/**
 * @brief Page blob created up front; all-zero chunks are not sent
 */
class page_blob_strategy : public upload_strategy {
public:
    using upload_strategy::upload_strategy;

    [[nodiscard]] auto kind() const noexcept -> plan_kind override {
        return plan_kind::page_range;
    }

    [[nodiscard]] auto prepare() -> result<void> override;

    [[nodiscard]] auto skipped_chunks() const noexcept -> uint32_t {
        return skipped_.load(std::memory_order_relaxed);
    }

protected:
    [[nodiscard]] auto write_chunk(const chunk_descriptor& chunk) -> result<void> override;
    void finalize() override;
    [[nodiscard]] auto should_delete_destination(transfer_status status) const
        -> bool override;

private:
    std::atomic<bool> created_{false};
    std::atomic<uint32_t> skipped_{0};
};

/**
 * @brief Strategy for a plan kind
 */
[[nodiscard]] auto make_upload_strategy(upload_session session)
    -> std::shared_ptr<upload_strategy>;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_STRATEGY_H
