/**
 * @file engine_config.h
 * @brief Configuration for the chunked upload engine
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_ENGINE_CONFIG_H
#define KCENON_BLOB_UPLOAD_CORE_ENGINE_CONFIG_H

#include <kcenon/blob_upload/core/logging.h>
#include <kcenon/blob_upload/core/types.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::blob_upload {

/**
 * @brief Engine-wide configuration
 *
 * Per-transfer values (chunk size, force-write, tiers) live in
 * transfer_info; this struct holds the limits and the shared resources'
 * sizing.
 */
struct engine_config {
    /// Default block size when a transfer does not set one (8MB)
    static constexpr uint64_t default_block_size = 8ULL * 1024 * 1024;

    /// Largest block the service accepts in one PUT Block (100MB)
    static constexpr uint64_t service_max_block_size = 100ULL * 1024 * 1024;

    /// Largest number of blocks a committed block list may hold
    static constexpr uint32_t service_max_block_count = 50000;

    /// Page blob write unit
    static constexpr uint64_t page_bytes = 512;

    /// Largest page range written by one chunk (4MB)
    static constexpr uint64_t default_page_chunk_max = 4ULL * 1024 * 1024;

    uint64_t block_size = default_block_size;
    uint64_t max_block_size = service_max_block_size;
    uint32_t max_block_count = service_max_block_count;
    uint64_t page_unit = page_bytes;
    uint64_t page_chunk_max = default_page_chunk_max;

    /// Worker threads consuming chunk units
    std::size_t worker_count = 16;

    /// Bounded work queue size; schedulers block when it is full
    std::size_t queue_capacity = 1024;

    /// Outbound rate for all transfers sharing this engine (0 = unlimited)
    uint64_t bytes_per_second = 0;

    log_level min_log_level = log_level::info;
    bool json_log_output = false;

    /**
     * @brief Validate configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Defaults overridden by BLOB_UPLOAD_* environment variables
     *
     * Recognized: BLOB_UPLOAD_BLOCK_SIZE, BLOB_UPLOAD_CONCURRENCY,
     * BLOB_UPLOAD_QUEUE_CAPACITY, BLOB_UPLOAD_BYTES_PER_SECOND,
     * BLOB_UPLOAD_LOG_LEVEL.
     */
    [[nodiscard]] static auto from_environment() -> result<engine_config>;
};

/**
 * @brief Fluent builder for engine_config
 *
 * @code
 * auto config = engine_config_builder()
 *     .with_block_size(4 * 1024 * 1024)
 *     .with_worker_count(8)
 *     .with_bytes_per_second(50 * 1024 * 1024)
 *     .build();
 * @endcode
 */
class engine_config_builder {
public:
    engine_config_builder() = default;
    explicit engine_config_builder(engine_config base) : config_(base) {}

    auto with_block_size(uint64_t size) -> engine_config_builder& {
        config_.block_size = size;
        return *this;
    }

    auto with_max_block_count(uint32_t count) -> engine_config_builder& {
        config_.max_block_count = count;
        return *this;
    }

    auto with_page_chunk_max(uint64_t size) -> engine_config_builder& {
        config_.page_chunk_max = size;
        return *this;
    }

    auto with_worker_count(std::size_t count) -> engine_config_builder& {
        config_.worker_count = count;
        return *this;
    }

    auto with_queue_capacity(std::size_t capacity) -> engine_config_builder& {
        config_.queue_capacity = capacity;
        return *this;
    }

    auto with_bytes_per_second(uint64_t rate) -> engine_config_builder& {
        config_.bytes_per_second = rate;
        return *this;
    }

    auto with_log_level(log_level level) -> engine_config_builder& {
        config_.min_log_level = level;
        return *this;
    }

    auto with_json_logs(bool enable = true) -> engine_config_builder& {
        config_.json_log_output = enable;
        return *this;
    }

    [[nodiscard]] auto build() const -> result<engine_config> {
        auto valid = config_.validate();
        if (!valid) {
            return unexpected{valid.error()};
        }
        return config_;
    }

private:
    engine_config config_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_ENGINE_CONFIG_H
