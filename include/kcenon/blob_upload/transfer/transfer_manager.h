/**
 * @file transfer_manager.h
 * @brief In-process transfer_manager_interface implementation
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_H
#define KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_H

#include "transfer_manager_interface.h"

#include "kcenon/blob_upload/adapters/thread_pool_adapter.h"

#include <chrono>
#include <functional>
#include <memory>

namespace kcenon::blob_upload {

/**
 * @brief Tracks one transfer and schedules its chunks on a shared pool
 *
 * Status is monotone: the first failure recorded wins and success never
 * replaces a failure. wait() returns once report_transfer_done() has been
 * called.
 *
 * @code
 * auto pool = adapters::chunk_pool_factory::create(16, 1024);
 * auto manager = std::make_shared<transfer_manager>(info, pool);
 * engine.start(manager, destination);
 * manager->wait();
 * @endcode
 */
class transfer_manager : public transfer_manager_interface {
public:
    using done_callback = std::function<void(transfer_status)>;

    /**
     * @param pool Worker pool; null runs every chunk on the scheduling thread
     * @param on_done Called once with the final status
     */
    transfer_manager(transfer_info info,
                     std::shared_ptr<adapters::chunk_pool_interface> pool,
                     done_callback on_done = {});

    ~transfer_manager() override;

    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;

    [[nodiscard]] auto info() const -> const transfer_info& override;
    [[nodiscard]] auto was_cancelled() const -> bool override;
    void cancel() override;
    [[nodiscard]] auto context() const -> cancellation_token override;

    void set_status(transfer_status status) override;
    [[nodiscard]] auto status() const -> transfer_status override;

    void add_bytes_done(uint64_t bytes) override;
    void set_number_of_chunks(uint32_t count) override;
    [[nodiscard]] auto report_chunk_done() -> chunk_completion override;
    void report_transfer_done() override;

    void schedule_chunk(chunk_unit unit) override;

    [[nodiscard]] auto destination_headers_and_metadata(const source_mapping* mapping) const
        -> destination_data override;
    [[nodiscard]] auto tier_settings() const -> blob_tiers override;

    [[nodiscard]] auto should_log(log_level level) const -> bool override;
    void log(log_level level, std::string_view message) override;
    void log_upload_error(std::string_view message, int status_code) override;

    void occupy_connection() override;
    void release_connection() override;

    // ========================================================================
    // Observation
    // ========================================================================

    [[nodiscard]] auto bytes_done() const -> uint64_t;
    [[nodiscard]] auto number_of_chunks() const -> uint32_t;
    [[nodiscard]] auto chunks_done() const -> uint32_t;

    /**
     * @brief Number of report_transfer_done() calls so far
     */
    [[nodiscard]] auto done_count() const -> uint32_t;
    [[nodiscard]] auto is_done() const -> bool;

    [[nodiscard]] auto active_connections() const -> uint32_t;
    [[nodiscard]] auto peak_connections() const -> uint32_t;

    /**
     * @brief Block until the transfer is done
     */
    auto wait() -> transfer_status;

    /**
     * @return false if the timeout expired first
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_H
