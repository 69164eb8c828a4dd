/**
 * @file transfer_manager_interface.h
 * @brief Per-transfer state the upload engine reports into
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_INTERFACE_H
#define KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_INTERFACE_H

#include "transfer_info.h"

#include "kcenon/blob_upload/core/cancellation_token.h"
#include "kcenon/blob_upload/core/completion_coordinator.h"
#include "kcenon/blob_upload/core/logging.h"
#include "kcenon/blob_upload/core/source_mapping.h"
#include "kcenon/blob_upload/core/transfer_status.h"

#include <cstdint>
#include <functional>
#include <string_view>

namespace kcenon::blob_upload {

/**
 * @brief Owner of one transfer's lifecycle, as seen by the engine
 *
 * The engine never decides when a transfer is over; it calls
 * report_transfer_done() exactly once per transfer it starts. All methods
 * may be called concurrently from chunk workers.
 */
class transfer_manager_interface {
public:
    using chunk_unit = std::function<void()>;

    virtual ~transfer_manager_interface() = default;

    [[nodiscard]] virtual auto info() const -> const transfer_info& = 0;

    [[nodiscard]] virtual auto was_cancelled() const -> bool = 0;

    /**
     * @brief Cancel the transfer; chunks not yet started will skip
     */
    virtual void cancel() = 0;

    /**
     * @brief Token handed to remote calls
     */
    [[nodiscard]] virtual auto context() const -> cancellation_token = 0;

    /**
     * @brief Record an outcome; a failure is never replaced by another status
     */
    virtual void set_status(transfer_status status) = 0;
    [[nodiscard]] virtual auto status() const -> transfer_status = 0;

    virtual void add_bytes_done(uint64_t bytes) = 0;

    /**
     * @brief Total for the completion counter; set before scheduling
     */
    virtual void set_number_of_chunks(uint32_t count) = 0;

    [[nodiscard]] virtual auto report_chunk_done() -> chunk_completion = 0;

    virtual void report_transfer_done() = 0;

    /**
     * @brief Hand a chunk unit to the worker pool without waiting for it
     */
    virtual void schedule_chunk(chunk_unit unit) = 0;

    /**
     * @brief Content headers and metadata for the blob
     * @param mapping Mapped source used for Content-MD5; may be null
     */
    [[nodiscard]] virtual auto destination_headers_and_metadata(
        const source_mapping* mapping) const -> destination_data = 0;

    [[nodiscard]] virtual auto tier_settings() const -> blob_tiers = 0;

    [[nodiscard]] virtual auto should_log(log_level level) const -> bool = 0;
    virtual void log(log_level level, std::string_view message) = 0;

    /**
     * @brief Log a failed remote call with the service status code
     */
    virtual void log_upload_error(std::string_view message, int status_code) = 0;

    virtual void occupy_connection() = 0;
    virtual void release_connection() = 0;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_MANAGER_INTERFACE_H
