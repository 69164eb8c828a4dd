/**
 * @file engine_config.cpp
 * @brief Engine configuration validation and environment loading
 */

#include "kcenon/blob_upload/core/engine_config.h"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace kcenon::blob_upload {

namespace {

auto read_env(const char* name) -> std::optional<std::string_view> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string_view(value);
}

auto parse_unsigned(const char* name, std::string_view text) -> result<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return unexpected{error{error_code::invalid_configuration,
            std::string(name) + " is not an unsigned integer: " + std::string(text)}};
    }
    return value;
}

}  // namespace

auto engine_config::validate() const -> result<void> {
    if (block_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size, "block size must be positive"}};
    }
    if (block_size > max_block_size) {
        return unexpected{error{error_code::invalid_chunk_size,
            "block size too large (maximum: " + std::to_string(max_block_size) + ")"}};
    }
    if (max_block_count == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "maximum block count must be positive"}};
    }
    if (page_unit == 0 || page_chunk_max < page_unit || page_chunk_max % page_unit != 0) {
        return unexpected{error{error_code::invalid_configuration,
            "page chunk maximum must be a positive multiple of the page unit (" +
                std::to_string(page_unit) + ")"}};
    }
    if (worker_count == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "worker count must be positive"}};
    }
    if (queue_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "queue capacity must be positive"}};
    }
    return {};
}

auto engine_config::from_environment() -> result<engine_config> {
    engine_config config;

    if (auto text = read_env("BLOB_UPLOAD_BLOCK_SIZE")) {
        auto value = parse_unsigned("BLOB_UPLOAD_BLOCK_SIZE", *text);
        if (!value) return unexpected{value.error()};
        config.block_size = value.value();
    }
    if (auto text = read_env("BLOB_UPLOAD_CONCURRENCY")) {
        auto value = parse_unsigned("BLOB_UPLOAD_CONCURRENCY", *text);
        if (!value) return unexpected{value.error()};
        config.worker_count = static_cast<std::size_t>(value.value());
    }
    if (auto text = read_env("BLOB_UPLOAD_QUEUE_CAPACITY")) {
        auto value = parse_unsigned("BLOB_UPLOAD_QUEUE_CAPACITY", *text);
        if (!value) return unexpected{value.error()};
        config.queue_capacity = static_cast<std::size_t>(value.value());
    }
    if (auto text = read_env("BLOB_UPLOAD_BYTES_PER_SECOND")) {
        auto value = parse_unsigned("BLOB_UPLOAD_BYTES_PER_SECOND", *text);
        if (!value) return unexpected{value.error()};
        config.bytes_per_second = value.value();
    }
    if (auto text = read_env("BLOB_UPLOAD_LOG_LEVEL")) {
        auto level = log_level_from_string(*text);
        if (!level) {
            return unexpected{error{error_code::invalid_configuration,
                "BLOB_UPLOAD_LOG_LEVEL is not a log level: " + std::string(*text)}};
        }
        config.min_log_level = *level;
    }

    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return config;
}

}  // namespace kcenon::blob_upload
