/**
 * @file cloud_utils.h
 * @brief Encoding, signing and HTTP helpers for the Azure destination
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_CLOUD_CLOUD_UTILS_H
#define KCENON_BLOB_UPLOAD_CLOUD_CLOUD_UTILS_H

#include "cloud_config.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_upload::cloud_utils {

// ============================================================================
// Encoding
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

auto base64_encode(const std::vector<uint8_t>& data) -> std::string;
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Decode base64, skipping characters outside the alphabet
 */
auto base64_decode(const std::string& encoded) -> std::vector<uint8_t>;

/**
 * @brief Percent-encode everything but unreserved characters
 * @param encode_slash Leave '/' as is when false (blob paths)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Reverse of url_encode; '+' is kept literal
 */
auto url_decode(const std::string& value) -> std::string;

// ============================================================================
// Cryptography (OpenSSL)
// ============================================================================

auto hmac_sha256(const std::vector<uint8_t>& key, const std::string& data)
    -> std::vector<uint8_t>;

/**
 * @brief MD5 digest of a byte range, as carried in Content-MD5
 */
auto md5(std::span<const std::byte> data) -> std::vector<uint8_t>;

// ============================================================================
// Identifiers and time
// ============================================================================

/**
 * @brief Cryptographically random bytes
 */
auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t>;

/**
 * @brief RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
 */
auto generate_uuid_v4() -> std::string;

/**
 * @brief Block identifier: base64 of a fresh v4 UUID
 *
 * Every identifier has the same encoded length, which the service
 * requires for the blocks of one blob.
 */
auto make_block_id() -> std::string;

auto get_rfc1123_time() -> std::string;

// ============================================================================
// Responses
// ============================================================================

auto extract_xml_element(const std::string& xml, const std::string& tag)
    -> std::optional<std::string>;

/**
 * @brief Case-insensitive header lookup
 */
auto find_header(const std::map<std::string, std::string>& headers, const std::string& name)
    -> std::optional<std::string>;

/**
 * @brief MIME type guessed from a file name's extension
 */
auto detect_content_type(const std::string& key) -> std::string;

// ============================================================================
// Retry
// ============================================================================

auto calculate_retry_delay(const cloud_retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

auto is_retryable_status(int status_code, const cloud_retry_policy& policy) -> bool;

}  // namespace kcenon::blob_upload::cloud_utils

#endif  // KCENON_BLOB_UPLOAD_CLOUD_CLOUD_UTILS_H
