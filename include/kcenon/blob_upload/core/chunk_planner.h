/**
 * @file chunk_planner.h
 * @brief Splits one transfer into chunk descriptors and picks the strategy
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_CHUNK_PLANNER_H
#define KCENON_BLOB_UPLOAD_CORE_CHUNK_PLANNER_H

#include <kcenon/blob_upload/core/engine_config.h>
#include <kcenon/blob_upload/core/types.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief Upload strategy selected once per transfer
 */
enum class plan_kind {
    whole_object,  ///< One Put Blob of the entire source
    block_list,    ///< N staged blocks followed by a block list commit
    page_range,    ///< Page blob created up front, zero ranges skipped
};

[[nodiscard]] constexpr auto to_string(plan_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case plan_kind::whole_object: return "whole_object";
        case plan_kind::block_list: return "block_list";
        case plan_kind::page_range: return "page_range";
        default: return "unknown";
    }
}

/**
 * @brief Destination type requested for a transfer
 */
enum class blob_type_hint {
    detect,      ///< Page blob for ".vhd" sources, block blob otherwise
    block_blob,
    page_blob,
};

/**
 * @brief One contiguous byte range of the source
 */
struct chunk_descriptor {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] auto end() const noexcept -> uint64_t { return offset + length; }

    [[nodiscard]] auto operator==(const chunk_descriptor&) const -> bool = default;
};

/**
 * @brief Output of the planner for one transfer
 */
struct upload_plan {
    plan_kind kind = plan_kind::whole_object;
    uint64_t source_size = 0;

    /// Chunk size after page clamping; equals the source size for whole_object
    uint64_t chunk_size = 0;

    /// Count the planner computed before emitting descriptors
    uint32_t chunk_count = 0;

    std::vector<chunk_descriptor> chunks;

    /**
     * @brief Whether a descriptor is the final range of the source
     *
     * Informational only; completion is decided by the completion
     * coordinator, never by this flag.
     */
    [[nodiscard]] auto is_last(const chunk_descriptor& chunk) const noexcept -> bool {
        return chunk.index + 1 == chunk_count;
    }
};

/**
 * @brief Decides between whole-object, block-list and page-range uploads
 *
 * Decision order:
 * 1. size == 0 or size <= chunk size: whole object
 * 2. sparse eligible: page ranges of min(chunk, page maximum), rounded down
 *    to the page unit
 * 3. otherwise: blocks of the configured chunk size
 */
class chunk_planner {
public:
    explicit chunk_planner(const engine_config& config);

    /**
     * @brief Build the plan for one transfer
     * @param source_size Bytes in the source
     * @param chunk_size Configured chunk size for this transfer
     * @param sparse_eligible Destination is a fixed-size sparse (page) blob
     * @return Plan, or an error when the chunk size is unusable or the
     *         block count exceeds the service limit
     */
    [[nodiscard]] auto plan(uint64_t source_size,
                            uint64_t chunk_size,
                            bool sparse_eligible) const -> result<upload_plan>;

    /**
     * @brief Page-range chunk size derived from a configured chunk size
     */
    [[nodiscard]] auto page_chunk_size(uint64_t chunk_size) const noexcept -> uint64_t;

    /**
     * @brief Check that a plan's descriptors match its declared shape
     *
     * Verifies the descriptor count equals chunk_count, indices run
     * 0..N-1, ranges are contiguous and non-overlapping and sum to the
     * source size. A failure is an internal consistency fault.
     */
    [[nodiscard]] static auto validate(const upload_plan& plan) -> result<void>;

    [[nodiscard]] auto page_unit() const noexcept -> uint64_t { return page_unit_; }

private:
    uint64_t page_unit_;
    uint64_t page_chunk_max_;
    uint64_t max_block_size_;
    uint32_t max_block_count_;
};

/**
 * @brief Whether a source should be uploaded as a page blob
 *
 * With blob_type_hint::detect the source must end in ".vhd"
 * (case-insensitive); in every case the size must be a multiple of the
 * page unit.
 */
[[nodiscard]] auto is_sparse_eligible(std::string_view source_name,
                                      uint64_t source_size,
                                      blob_type_hint hint,
                                      uint64_t page_unit) -> bool;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_CHUNK_PLANNER_H
