/**
 * @file body_stream.h
 * @brief Rewindable request bodies handed to the destination
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_BODY_STREAM_H
#define KCENON_BLOB_UPLOAD_CORE_BODY_STREAM_H

#include <kcenon/blob_upload/core/types.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief Sequential reader over a request body
 *
 * Destinations drain the stream to build the request and rewind it before a
 * retry.
 */
class body_stream {
public:
    virtual ~body_stream() = default;

    /**
     * @brief Copy up to buffer.size() bytes into buffer
     * @return Bytes copied; 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Total body length
     */
    [[nodiscard]] virtual auto size() const noexcept -> uint64_t = 0;

    virtual void rewind() = 0;

    [[nodiscard]] virtual auto position() const noexcept -> uint64_t = 0;
};

/**
 * @brief Body backed by a span of memory the caller keeps alive
 */
class memory_body_stream : public body_stream {
public:
    memory_body_stream() = default;
    explicit memory_body_stream(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto n = std::min(buffer.size(), data_.size() - position_);
        if (n > 0) {
            std::memcpy(buffer.data(), data_.data() + position_, n);
            position_ += n;
        }
        return n;
    }

    [[nodiscard]] auto size() const noexcept -> uint64_t override { return data_.size(); }

    void rewind() override { position_ = 0; }

    [[nodiscard]] auto position() const noexcept -> uint64_t override { return position_; }

private:
    std::span<const std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Drain a stream from its start into a byte vector
 */
[[nodiscard]] inline auto read_all(body_stream& stream) -> result<std::vector<uint8_t>> {
    stream.rewind();
    std::vector<uint8_t> out(static_cast<std::size_t>(stream.size()));
    std::size_t filled = 0;
    while (filled < out.size()) {
        auto view = std::as_writable_bytes(std::span<uint8_t>(out).subspan(filled));
        auto got = stream.read(view);
        if (!got) {
            return unexpected{got.error()};
        }
        if (got.value() == 0) {
            return unexpected{error{error_code::source_range_error,
                "body ended after " + std::to_string(filled) + " of " +
                    std::to_string(out.size()) + " bytes"}};
        }
        filled += got.value();
    }
    return out;
}

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_BODY_STREAM_H
