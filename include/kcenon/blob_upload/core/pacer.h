/**
 * @file pacer.h
 * @brief Outbound byte-rate limiting for chunk writes
 *
 * A token bucket shared by every transfer of an engine, and a body_stream
 * decorator that draws from it as the destination reads the body.
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_PACER_H
#define KCENON_BLOB_UPLOAD_CORE_PACER_H

#include <kcenon/blob_upload/core/body_stream.h>
#include <kcenon/blob_upload/core/cancellation_token.h>
#include <kcenon/blob_upload/core/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace kcenon::blob_upload {

/**
 * @brief Token bucket rate limiter
 *
 * The bucket holds one second worth of bytes and starts full. Requests
 * larger than the bucket are granted in bucket-sized pieces.
 *
 * @code
 * auto limiter = std::make_shared<pacer>(10 * 1024 * 1024);  // 10 MB/s
 * auto status = limiter->acquire(chunk.length, manager.context());
 * @endcode
 */
class pacer {
public:
    /**
     * @param bytes_per_second Rate limit; 0 means unlimited
     */
    explicit pacer(uint64_t bytes_per_second = 0);

    /**
     * @brief Wakes waiting threads, which then return without throttling
     */
    ~pacer();

    pacer(const pacer&) = delete;
    auto operator=(const pacer&) -> pacer& = delete;

    /**
     * @brief Block until bytes may be sent
     *
     * @return transfer_cancelled if the token is cancelled while waiting
     */
    [[nodiscard]] auto acquire(uint64_t bytes, const cancellation_token& token = {})
        -> result<void>;

    /**
     * @brief Take tokens only if available right now
     */
    [[nodiscard]] auto try_acquire(uint64_t bytes) -> bool;

    /**
     * @brief Change the rate; 0 disables limiting
     */
    void set_limit(uint64_t bytes_per_second);

    [[nodiscard]] auto get_limit() const noexcept -> uint64_t;
    [[nodiscard]] auto is_enabled() const noexcept -> bool;
    [[nodiscard]] auto available_tokens() const -> uint64_t;
    [[nodiscard]] auto bucket_capacity() const -> uint64_t;

private:
    /// Takes at most one bucket of bytes; returns how many were granted
    auto acquire_piece(uint64_t bytes, const cancellation_token& token) -> result<uint64_t>;
    void refill_tokens();
    [[nodiscard]] auto wait_time(uint64_t bytes) const -> std::chrono::microseconds;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> bytes_per_second_;
    std::atomic<bool> enabled_;

    double tokens_ = 0.0;
    double capacity_ = 0.0;
    std::chrono::steady_clock::time_point last_refill_;
};

/**
 * @brief body_stream decorator throttling reads through a pacer
 *
 * Reads are cut to at most read_block bytes so a large chunk is paced
 * smoothly rather than in one burst.
 */
class paced_body_stream : public body_stream {
public:
    static constexpr std::size_t read_block = 64 * 1024;

    paced_body_stream(std::unique_ptr<body_stream> inner,
                      std::shared_ptr<pacer> limiter,
                      cancellation_token token = {});

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto size() const noexcept -> uint64_t override;
    void rewind() override;
    [[nodiscard]] auto position() const noexcept -> uint64_t override;

private:
    std::unique_ptr<body_stream> inner_;
    std::shared_ptr<pacer> pacer_;
    cancellation_token token_;
};

/**
 * @brief Body over a span, paced when a limiter is given
 */
[[nodiscard]] auto make_paced_body(std::span<const std::byte> data,
                                   const std::shared_ptr<pacer>& limiter,
                                   cancellation_token token) -> std::unique_ptr<body_stream>;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_PACER_H
