/**
 * @file transfer_info.h
 * @brief Immutable description of one upload
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_INFO_H
#define KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_INFO_H

#include "kcenon/blob_upload/cloud/blob_destination.h"
#include "kcenon/blob_upload/core/chunk_planner.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::blob_upload {

/**
 * @brief Access tier for block blobs
 */
enum class block_blob_tier {
    none,
    hot,
    cool,
    archive,
};

[[nodiscard]] constexpr auto to_string(block_blob_tier tier) noexcept -> std::string_view {
    switch (tier) {
        case block_blob_tier::hot: return "Hot";
        case block_blob_tier::cool: return "Cool";
        case block_blob_tier::archive: return "Archive";
        default: return "";
    }
}

/**
 * @brief Performance tier for premium page blobs
 */
enum class page_blob_tier {
    none,
    p4,
    p6,
    p10,
    p15,
    p20,
    p30,
    p40,
    p50,
    p60,
    p70,
    p80,
};

[[nodiscard]] constexpr auto to_string(page_blob_tier tier) noexcept -> std::string_view {
    switch (tier) {
        case page_blob_tier::p4: return "P4";
        case page_blob_tier::p6: return "P6";
        case page_blob_tier::p10: return "P10";
        case page_blob_tier::p15: return "P15";
        case page_blob_tier::p20: return "P20";
        case page_blob_tier::p30: return "P30";
        case page_blob_tier::p40: return "P40";
        case page_blob_tier::p50: return "P50";
        case page_blob_tier::p60: return "P60";
        case page_blob_tier::p70: return "P70";
        case page_blob_tier::p80: return "P80";
        default: return "";
    }
}

struct blob_tiers {
    block_blob_tier block = block_blob_tier::none;
    page_blob_tier page = page_blob_tier::none;
};

/**
 * @brief Properties and metadata written with the blob
 */
struct destination_data {
    blob_http_headers headers;
    blob_metadata metadata;
};

/**
 * @brief One local file to one remote blob
 *
 * Shared read-only by every chunk worker of the transfer.
 */
struct transfer_info {
    std::filesystem::path source;

    /// Destination identifier used in logs
    std::string destination;

    uint64_t source_size = 0;

    /// Chunk size for this transfer; 0 uses the engine default
    uint64_t block_size = 0;

    /// Overwrite an existing blob instead of failing with BlobAlreadyExists
    bool force_write = false;

    blob_type_hint blob_type = blob_type_hint::detect;
    blob_tiers tiers;

    blob_http_headers headers;

    /// Keep content_type empty instead of guessing it from the extension
    bool no_guess_mime_type = false;

    /// Store the MD5 of the source as the blob's Content-MD5
    bool put_md5 = false;

    blob_metadata metadata;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_TRANSFER_TRANSFER_INFO_H
