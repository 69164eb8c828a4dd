/**
 * @file pacer.cpp
 * @brief Token bucket pacing of outbound bytes
 */

#include "kcenon/blob_upload/core/pacer.h"

#include "kcenon/blob_upload/core/logging.h"

#include <algorithm>
#include <string>

namespace kcenon::blob_upload {

namespace {

// Upper bound on one wait so a cancelled transfer stops waiting promptly.
constexpr auto max_wait_slice = std::chrono::milliseconds(50);

}  // namespace

pacer::pacer(uint64_t bytes_per_second)
    : bytes_per_second_(bytes_per_second)
    , enabled_(bytes_per_second > 0)
    , last_refill_(std::chrono::steady_clock::now()) {
    if (bytes_per_second > 0) {
        capacity_ = static_cast<double>(bytes_per_second);
        tokens_ = capacity_;
    }
}

pacer::~pacer() {
    {
        std::lock_guard lock(mutex_);
        enabled_ = false;
    }
    cv_.notify_all();
}

auto pacer::acquire(uint64_t bytes, const cancellation_token& token) -> result<void> {
    while (bytes > 0 && enabled_.load(std::memory_order_relaxed)) {
        auto granted = acquire_piece(bytes, token);
        if (!granted) {
            return unexpected{granted.error()};
        }
        bytes -= granted.value();
    }
    return {};
}

auto pacer::acquire_piece(uint64_t bytes, const cancellation_token& token) -> result<uint64_t> {
    std::unique_lock lock(mutex_);

    while (enabled_.load(std::memory_order_relaxed)) {
        if (token.is_cancelled()) {
            return unexpected{error{error_code::transfer_cancelled,
                "cancelled while waiting for pacer"}};
        }

        // set_limit() may shrink the bucket while this caller waits.
        uint64_t piece = std::min(bytes, std::max<uint64_t>(static_cast<uint64_t>(capacity_), 1));

        refill_tokens();
        if (tokens_ >= static_cast<double>(piece)) {
            tokens_ -= static_cast<double>(piece);
            return piece;
        }

        auto wait = std::min<std::chrono::microseconds>(wait_time(piece), max_wait_slice);
        if (wait <= std::chrono::microseconds::zero()) {
            tokens_ -= static_cast<double>(piece);
            return piece;
        }

        cv_.wait_for(lock, wait);
    }
    return bytes;
}

auto pacer::try_acquire(uint64_t bytes) -> bool {
    if (bytes == 0 || !enabled_.load(std::memory_order_relaxed)) {
        return true;
    }

    std::lock_guard lock(mutex_);
    refill_tokens();
    if (tokens_ >= static_cast<double>(bytes)) {
        tokens_ -= static_cast<double>(bytes);
        return true;
    }
    return false;
}

void pacer::set_limit(uint64_t bytes_per_second) {
    {
        std::lock_guard lock(mutex_);
        auto old_limit = bytes_per_second_.exchange(bytes_per_second);

        if (bytes_per_second > 0) {
            double new_capacity = static_cast<double>(bytes_per_second);
            if (old_limit > 0 && capacity_ > 0) {
                tokens_ = std::min(tokens_ * (new_capacity / capacity_), new_capacity);
            } else {
                tokens_ = new_capacity;
            }
            capacity_ = new_capacity;
            last_refill_ = std::chrono::steady_clock::now();
            enabled_ = true;
        } else {
            enabled_ = false;
        }
    }
    cv_.notify_all();

    BU_LOG_DEBUG(log_category::pacer,
                 "pacer limit set to " + std::to_string(bytes_per_second) + " B/s");
}

auto pacer::get_limit() const noexcept -> uint64_t {
    return bytes_per_second_.load(std::memory_order_relaxed);
}

auto pacer::is_enabled() const noexcept -> bool {
    return enabled_.load(std::memory_order_relaxed);
}

auto pacer::available_tokens() const -> uint64_t {
    std::lock_guard lock(mutex_);
    const_cast<pacer*>(this)->refill_tokens();
    return static_cast<uint64_t>(std::max(0.0, tokens_));
}

auto pacer::bucket_capacity() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return static_cast<uint64_t>(capacity_);
}

void pacer::refill_tokens() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_refill_);
    if (elapsed.count() > 0.0) {
        double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
        tokens_ = std::min(tokens_ + elapsed.count() * rate, capacity_);
        last_refill_ = now;
    }
}

auto pacer::wait_time(uint64_t bytes) const -> std::chrono::microseconds {
    double needed = static_cast<double>(bytes) - tokens_;
    double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    if (needed <= 0.0 || rate <= 0.0) {
        return std::chrono::microseconds::zero();
    }
    return std::chrono::microseconds(static_cast<int64_t>(needed / rate * 1'000'000.0) + 1);
}

// paced_body_stream

paced_body_stream::paced_body_stream(std::unique_ptr<body_stream> inner,
                                     std::shared_ptr<pacer> limiter,
                                     cancellation_token token)
    : inner_(std::move(inner)), pacer_(std::move(limiter)), token_(std::move(token)) {}

auto paced_body_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto got = inner_->read(buffer.first(std::min(buffer.size(), read_block)));
    if (!got || got.value() == 0 || !pacer_) {
        return got;
    }
    auto granted = pacer_->acquire(got.value(), token_);
    if (!granted) {
        return unexpected{granted.error()};
    }
    return got;
}

auto paced_body_stream::size() const noexcept -> uint64_t {
    return inner_->size();
}

void paced_body_stream::rewind() {
    inner_->rewind();
}

auto paced_body_stream::position() const noexcept -> uint64_t {
    return inner_->position();
}

auto make_paced_body(std::span<const std::byte> data,
                     const std::shared_ptr<pacer>& limiter,
                     cancellation_token token) -> std::unique_ptr<body_stream> {
    auto body = std::make_unique<memory_body_stream>(data);
    if (!limiter) {
        return body;
    }
    return std::make_unique<paced_body_stream>(std::move(body), limiter, std::move(token));
}

}  // namespace kcenon::blob_upload
