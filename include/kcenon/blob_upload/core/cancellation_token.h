/**
 * @file cancellation_token.h
 * @brief Transfer-scoped cooperative cancellation
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_CANCELLATION_TOKEN_H
#define KCENON_BLOB_UPLOAD_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace kcenon::blob_upload {

class cancellation_source;

/**
 * @brief Read-only view of a cancellation flag
 *
 * Cheap to copy. A default-constructed token is never cancelled, which is
 * what cleanup calls use so that they still run after the transfer was
 * cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_ && state_->load(std::memory_order_acquire);
    }

    [[nodiscard]] static auto none() -> cancellation_token { return {}; }

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<const std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const std::atomic<bool>> state_;
};

/**
 * @brief Owner of a cancellation flag
 */
class cancellation_source {
public:
    cancellation_source() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Raise the flag
     * @return true if this call performed the transition
     */
    auto cancel() noexcept -> bool {
        bool expected = false;
        return state_->compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto token() const -> cancellation_token {
        return cancellation_token(state_);
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_CANCELLATION_TOKEN_H
