/**
 * @file completion_coordinator.h
 * @brief Race-free detection of the last finished chunk
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_COMPLETION_COORDINATOR_H
#define KCENON_BLOB_UPLOAD_CORE_COMPLETION_COORDINATOR_H

#include <atomic>
#include <cstdint>

namespace kcenon::blob_upload {

/**
 * @brief Outcome of reporting one chunk
 */
struct chunk_completion {
    bool is_last = false;

    /// Chunks done including this one
    uint32_t chunks_done = 0;
};

/**
 * @brief Counts chunks that reached a terminal per-chunk outcome
 *
 * Exactly one caller of report_chunk_done() sees is_last == true: the one
 * whose increment moved the counter to the total. The acq_rel increment
 * also makes every write a worker did before reporting visible to the
 * caller that observes is_last.
 */
class completion_coordinator {
public:
    completion_coordinator() = default;
    explicit completion_coordinator(uint32_t total) : total_(total) {}

    completion_coordinator(const completion_coordinator&) = delete;
    auto operator=(const completion_coordinator&) -> completion_coordinator& = delete;

    /**
     * @brief Set the number of chunks; call before any chunk is scheduled
     */
    void set_total(uint32_t total) noexcept { total_.store(total, std::memory_order_release); }

    [[nodiscard]] auto total() const noexcept -> uint32_t {
        return total_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto report_chunk_done() noexcept -> chunk_completion {
        uint32_t done = done_.fetch_add(1, std::memory_order_acq_rel) + 1;
        return chunk_completion{done == total_.load(std::memory_order_acquire), done};
    }

    [[nodiscard]] auto chunks_done() const noexcept -> uint32_t {
        return done_.load(std::memory_order_acquire);
    }

private:
    std::atomic<uint32_t> total_{0};
    std::atomic<uint32_t> done_{0};
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_COMPLETION_COORDINATOR_H
