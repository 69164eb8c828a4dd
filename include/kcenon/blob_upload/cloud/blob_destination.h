/**
 * @file blob_destination.h
 * @brief Remote blob operations used by the upload engine
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_CLOUD_BLOB_DESTINATION_H
#define KCENON_BLOB_UPLOAD_CLOUD_BLOB_DESTINATION_H

#include "kcenon/blob_upload/core/body_stream.h"
#include "kcenon/blob_upload/core/cancellation_token.h"
#include "kcenon/blob_upload/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief Standard HTTP properties stored with a blob
 *
 * Empty fields are not sent.
 */
struct blob_http_headers {
    std::string content_type;
    std::string content_encoding;
    std::string content_language;
    std::string content_disposition;
    std::string cache_control;

    /// Base64 MD5 of the whole blob
    std::string content_md5;

    [[nodiscard]] auto operator==(const blob_http_headers&) const -> bool = default;
};

using blob_metadata = std::map<std::string, std::string>;

/**
 * @brief Subset of Get Blob Properties the engine looks at
 */
struct blob_properties {
    uint64_t content_length = 0;
    std::string blob_type;
    std::string etag;
    std::string access_tier;
};

/**
 * @brief One destination blob
 *
 * Every call returns a remote error with the service status code in
 * error::status_code (0 when no response was received). Calls check the
 * token before sending; a call already in flight is not interrupted.
 * Implementations must allow concurrent calls from several workers.
 */
class blob_destination {
public:
    virtual ~blob_destination() = default;

    /**
     * @brief Destination identifier for logs
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @return blob_not_found (status 404) when the blob does not exist
     */
    [[nodiscard]] virtual auto get_properties(const cancellation_token& token)
        -> result<blob_properties> = 0;

    /**
     * @brief Create an empty page blob of a fixed size
     */
    [[nodiscard]] virtual auto create_page_blob(uint64_t size,
                                                const blob_http_headers& headers,
                                                const blob_metadata& metadata,
                                                const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Upload one uncommitted block
     */
    [[nodiscard]] virtual auto stage_block(const std::string& block_id,
                                           body_stream& body,
                                           const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Write a page-aligned range starting at offset
     */
    [[nodiscard]] virtual auto upload_pages(uint64_t offset,
                                            body_stream& body,
                                            const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Assemble staged blocks, in order, into the blob
     */
    [[nodiscard]] virtual auto commit_block_list(const std::vector<std::string>& block_ids,
                                                 const blob_http_headers& headers,
                                                 const blob_metadata& metadata,
                                                 const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Upload the whole blob in one request; body may be empty
     */
    [[nodiscard]] virtual auto upload(body_stream& body,
                                      const blob_http_headers& headers,
                                      const blob_metadata& metadata,
                                      const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Set the access tier ("Hot", "Cool", "Archive", "P10", ...)
     */
    [[nodiscard]] virtual auto set_tier(std::string_view tier, const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Delete the blob and its uncommitted blocks
     * @return blob_not_found (status 404) when nothing was there
     */
    [[nodiscard]] virtual auto delete_blob(const cancellation_token& token) -> result<void> = 0;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CLOUD_BLOB_DESTINATION_H
