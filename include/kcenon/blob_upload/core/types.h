/**
 * @file types.h
 * @brief Core type definitions for blob_upload
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_TYPES_H
#define KCENON_BLOB_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_upload {

/**
 * @brief Error codes for blob upload operations
 */
enum class error_code {
    success = 0,

    // Source errors (-100 to -119)
    source_not_found = -100,
    source_access_denied = -101,
    source_open_failed = -102,
    source_map_failed = -103,
    source_size_mismatch = -104,
    source_range_error = -105,

    // Planning errors (-120 to -139)
    invalid_chunk_size = -120,
    too_many_chunks = -121,
    plan_not_contiguous = -122,

    // Configuration errors (-140 to -159)
    invalid_configuration = -141,
    missing_destination = -142,
    missing_credentials = -143,

    // Remote errors (-160 to -199)
    remote_error = -160,
    blob_not_found = -161,
    blob_already_exists = -162,
    remote_auth_failed = -163,
    remote_throttled = -164,
    remote_unavailable = -165,
    connection_failed = -166,
    http_client_unavailable = -167,

    // Transfer errors (-200 to -219)
    transfer_cancelled = -200,
    schedule_rejected = -201,
    pool_stopped = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
    internal_consistency = -221,
    not_initialized = -222,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::source_not_found:
            return "source not found";
        case error_code::source_access_denied:
            return "source access denied";
        case error_code::source_open_failed:
            return "source open failed";
        case error_code::source_map_failed:
            return "source memory mapping failed";
        case error_code::source_size_mismatch:
            return "source size mismatch";
        case error_code::source_range_error:
            return "source range out of bounds";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::too_many_chunks:
            return "too many chunks";
        case error_code::plan_not_contiguous:
            return "chunk plan not contiguous";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_destination:
            return "missing destination";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::remote_error:
            return "remote error";
        case error_code::blob_not_found:
            return "blob not found";
        case error_code::blob_already_exists:
            return "blob already exists";
        case error_code::remote_auth_failed:
            return "remote authentication failed";
        case error_code::remote_throttled:
            return "remote request throttled";
        case error_code::remote_unavailable:
            return "remote service unavailable";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::http_client_unavailable:
            return "http client unavailable";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::schedule_rejected:
            return "chunk schedule rejected";
        case error_code::pool_stopped:
            return "worker pool stopped";
        case error_code::internal_error:
            return "internal error";
        case error_code::internal_consistency:
            return "internal consistency fault";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and optional remote status code
 *
 * status_code carries the HTTP-like status of a remote failure, or 0 when
 * the failure never reached the service.
 */
struct error {
    error_code code;
    std::string message;
    int status_code = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), status_code(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto is_not_found() const noexcept -> bool {
        return code == error_code::blob_not_found || status_code == 404;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Map an HTTP status code returned by the service to an error code
 */
[[nodiscard]] constexpr auto error_code_from_status(int status_code) -> error_code {
    switch (status_code) {
        case 401:
        case 403:
            return error_code::remote_auth_failed;
        case 404:
            return error_code::blob_not_found;
        case 409:
            return error_code::blob_already_exists;
        case 429:
            return error_code::remote_throttled;
        case 503:
            return error_code::remote_unavailable;
        default:
            return error_code::remote_error;
    }
}

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_TYPES_H
