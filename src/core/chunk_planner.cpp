/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk planning
 */

#include <kcenon/blob_upload/core/chunk_planner.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace kcenon::blob_upload {

namespace {

auto ends_with_ignore_case(std::string_view value, std::string_view suffix) -> bool {
    if (value.size() < suffix.size()) {
        return false;
    }
    auto tail = value.substr(value.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

}  // namespace

chunk_planner::chunk_planner(const engine_config& config)
    : page_unit_(config.page_unit),
      page_chunk_max_(config.page_chunk_max),
      max_block_size_(config.max_block_size),
      max_block_count_(config.max_block_count) {}

auto chunk_planner::page_chunk_size(uint64_t chunk_size) const noexcept -> uint64_t {
    uint64_t size = std::min(chunk_size, page_chunk_max_);
    size -= size % page_unit_;
    return size == 0 ? page_unit_ : size;
}

auto chunk_planner::plan(uint64_t source_size,
                         uint64_t chunk_size,
                         bool sparse_eligible) const -> result<upload_plan> {
    upload_plan plan;
    plan.source_size = source_size;

    if (source_size == 0 || source_size <= chunk_size) {
        plan.kind = plan_kind::whole_object;
        plan.chunk_size = source_size;
        plan.chunk_count = 1;
        plan.chunks.push_back(chunk_descriptor{0, 0, source_size});
        return plan;
    }

    if (chunk_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size, "chunk size must be positive"}};
    }

    if (sparse_eligible) {
        plan.kind = plan_kind::page_range;
        plan.chunk_size = page_chunk_size(chunk_size);
    } else {
        if (chunk_size > max_block_size_) {
            return unexpected{error{error_code::invalid_chunk_size,
                "block size " + std::to_string(chunk_size) + " exceeds maximum " +
                    std::to_string(max_block_size_)}};
        }
        plan.kind = plan_kind::block_list;
        plan.chunk_size = chunk_size;
    }

    uint64_t count = (source_size + plan.chunk_size - 1) / plan.chunk_size;
    if (plan.kind == plan_kind::block_list && count > max_block_count_) {
        return unexpected{error{error_code::too_many_chunks,
            "source needs " + std::to_string(count) + " blocks, maximum is " +
                std::to_string(max_block_count_) + "; increase the block size"}};
    }
    if (count > UINT32_MAX) {
        return unexpected{error{error_code::too_many_chunks,
            "source needs " + std::to_string(count) + " page ranges"}};
    }
    plan.chunk_count = static_cast<uint32_t>(count);

    plan.chunks.reserve(plan.chunk_count);
    uint32_t index = 0;
    for (uint64_t offset = 0; offset < source_size; offset += plan.chunk_size) {
        uint64_t length = std::min(plan.chunk_size, source_size - offset);
        plan.chunks.push_back(chunk_descriptor{index++, offset, length});
    }

    return plan;
}

auto chunk_planner::validate(const upload_plan& plan) -> result<void> {
    if (plan.chunks.size() != plan.chunk_count) {
        return unexpected{error{error_code::internal_consistency,
            "planned " + std::to_string(plan.chunk_count) + " chunks but emitted " +
                std::to_string(plan.chunks.size())}};
    }

    uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < plan.chunks.size(); ++i) {
        const auto& chunk = plan.chunks[i];
        if (chunk.index != i) {
            return unexpected{error{error_code::internal_consistency,
                "chunk at position " + std::to_string(i) + " has index " +
                    std::to_string(chunk.index)}};
        }
        if (chunk.offset != expected_offset) {
            return unexpected{error{error_code::internal_consistency,
                "chunk " + std::to_string(i) + " starts at " + std::to_string(chunk.offset) +
                    ", expected " + std::to_string(expected_offset)}};
        }
        if (chunk.length == 0 && plan.source_size != 0) {
            return unexpected{error{error_code::internal_consistency,
                "chunk " + std::to_string(i) + " is empty"}};
        }
        expected_offset = chunk.end();
    }

    if (expected_offset != plan.source_size) {
        return unexpected{error{error_code::internal_consistency,
            "chunks cover " + std::to_string(expected_offset) + " of " +
                std::to_string(plan.source_size) + " bytes"}};
    }

    return {};
}

auto is_sparse_eligible(std::string_view source_name,
                        uint64_t source_size,
                        blob_type_hint hint,
                        uint64_t page_unit) -> bool {
    if (page_unit == 0 || source_size % page_unit != 0) {
        return false;
    }

    switch (hint) {
        case blob_type_hint::page_blob:
            return true;
        case blob_type_hint::block_blob:
            return false;
        case blob_type_hint::detect:
        default:
            return ends_with_ignore_case(source_name, ".vhd");
    }
}

}  // namespace kcenon::blob_upload
