/**
 * @file zero_scan.h
 * @brief All-zero detection for page range chunks
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_ZERO_SCAN_H
#define KCENON_BLOB_UPLOAD_CORE_ZERO_SCAN_H

#include <cstddef>
#include <span>

namespace kcenon::blob_upload {

/**
 * @brief Check whether every byte of a range is zero
 *
 * Scans in 64-bit words and finishes the remainder byte by byte, so any
 * length is handled. The buffer may have any alignment.
 */
[[nodiscard]] auto is_all_zero(std::span<const std::byte> data) noexcept -> bool;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_ZERO_SCAN_H
