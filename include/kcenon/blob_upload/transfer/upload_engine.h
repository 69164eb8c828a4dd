/**
 * @file upload_engine.h
 * @brief Entry point that plans a transfer and schedules its chunks
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_ENGINE_H
#define KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_ENGINE_H

#include "transfer_manager_interface.h"
#include "upload_strategy.h"

#include "kcenon/blob_upload/cloud/blob_destination.h"
#include "kcenon/blob_upload/core/chunk_planner.h"
#include "kcenon/blob_upload/core/engine_config.h"
#include "kcenon/blob_upload/core/pacer.h"
#include "kcenon/blob_upload/core/source_mapping.h"

#include <memory>

namespace kcenon::blob_upload {

/**
 * @brief Starts uploads; one engine serves many concurrent transfers
 *
 * start() runs the prologue on the calling thread, then hands every chunk
 * to the manager's scheduler and returns without waiting. Every transfer
 * passed to start() is eventually reported done exactly once, including
 * those that end in the prologue.
 *
 * @code
 * upload_engine engine(config, std::make_shared<pacer>(config.bytes_per_second));
 * auto started = engine.start(manager, destination);
 * if (!started) {
 *     // internal consistency fault; manager is already done (Failed)
 * }
 * @endcode
 */
class upload_engine {
public:
    /**
     * @param limiter Shared pacer for every transfer; null disables pacing
     * @param opener Maps the source; replaced in tests
     */
    explicit upload_engine(engine_config config,
                           std::shared_ptr<pacer> limiter = nullptr,
                           source_opener opener = open_mapped_file);

    /**
     * @brief Begin one transfer
     * @return internal_consistency when the plan does not match its own
     *         declared shape, invalid_configuration for missing collaborators;
     *         success otherwise, whatever the transfer's eventual status
     */
    [[nodiscard]] auto start(std::shared_ptr<transfer_manager_interface> manager,
                             std::shared_ptr<blob_destination> destination) -> result<void>;

    [[nodiscard]] auto config() const noexcept -> const engine_config& { return config_; }
    [[nodiscard]] auto limiter() const noexcept -> const std::shared_ptr<pacer>& {
        return limiter_;
    }

private:
    /**
     * @brief Ends a transfer before any mapping or remote write exists
     */
    static void finish_early(transfer_manager_interface& manager,
                             transfer_status status,
                             const error& cause);

    engine_config config_;
    chunk_planner planner_;
    std::shared_ptr<pacer> limiter_;
    source_opener opener_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_TRANSFER_UPLOAD_ENGINE_H
