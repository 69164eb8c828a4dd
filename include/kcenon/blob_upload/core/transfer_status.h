/**
 * @file transfer_status.h
 * @brief Terminal and in-flight states of a single transfer
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_TRANSFER_STATUS_H
#define KCENON_BLOB_UPLOAD_CORE_TRANSFER_STATUS_H

#include <cstdint>
#include <string_view>

namespace kcenon::blob_upload {

/**
 * @brief Transfer status
 *
 * Values below zero are failure variants. The ordering is used by the
 * transfer manager: a failure is never replaced by success.
 */
enum class transfer_status : int8_t {
    in_progress = 0,
    success = 1,
    failed = -1,
    blob_already_exists = -2,
    tier_set_failure = -3,
    cancelled = -4,
};

[[nodiscard]] constexpr auto is_failure(transfer_status status) noexcept -> bool {
    return static_cast<int8_t>(status) < 0;
}

[[nodiscard]] constexpr auto is_terminal(transfer_status status) noexcept -> bool {
    return status != transfer_status::in_progress;
}

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> std::string_view {
    switch (status) {
        case transfer_status::in_progress:
            return "InProgress";
        case transfer_status::success:
            return "Success";
        case transfer_status::failed:
            return "Failed";
        case transfer_status::blob_already_exists:
            return "BlobAlreadyExists";
        case transfer_status::tier_set_failure:
            return "TierSetFailure";
        case transfer_status::cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_TRANSFER_STATUS_H
