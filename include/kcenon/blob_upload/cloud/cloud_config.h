/**
 * @file cloud_config.h
 * @brief Azure destination configuration and retry policy
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_CLOUD_CLOUD_CONFIG_H
#define KCENON_BLOB_UPLOAD_CLOUD_CLOUD_CONFIG_H

#include "kcenon/blob_upload/core/types.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace kcenon::blob_upload {

/**
 * @brief Retry policy for remote calls
 */
struct cloud_retry_policy {
    /// Maximum number of attempts, the first one included
    std::size_t max_attempts = 3;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /// Retry on 429 and 503
    bool retry_on_rate_limit = true;

    /// Retry when the request never got a response
    bool retry_on_connection_error = true;

    /// Retry on server errors (5xx)
    bool retry_on_server_error = true;

    /**
     * @brief Single attempt, no waiting
     */
    [[nodiscard]] static auto no_retry() -> cloud_retry_policy {
        cloud_retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }
};

/**
 * @brief Addressing and credentials for one destination blob
 *
 * Either account_key (SharedKey signing) or sas_token must be set.
 */
struct azure_destination_config {
    std::string account_name;
    std::string container;
    std::string blob_name;

    /// Overrides https://{account}.blob.{suffix}
    std::optional<std::string> endpoint;
    std::string endpoint_suffix = "core.windows.net";
    bool use_ssl = true;

    std::string api_version = "2020-10-02";

    std::optional<std::string> account_key;

    /// SAS query string without the leading '?'
    std::optional<std::string> sas_token;

    cloud_retry_policy retry;
    std::chrono::milliseconds timeout{30000};

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Base URL of the account, without trailing slash
     */
    [[nodiscard]] auto endpoint_url() const -> std::string;

    /**
     * @brief Blob URL without any query string
     */
    [[nodiscard]] auto blob_url() const -> std::string;

    /**
     * @brief Build from a storage connection string
     *
     * Recognized keys: AccountName, AccountKey, EndpointSuffix,
     * SharedAccessSignature, BlobEndpoint.
     */
    [[nodiscard]] static auto from_connection_string(const std::string& connection_string,
                                                     const std::string& container,
                                                     const std::string& blob_name)
        -> result<azure_destination_config>;

    /**
     * @brief Build from a blob URL, optionally carrying a SAS query
     *
     * e.g. https://account.blob.core.windows.net/container/dir/file.vhd?sv=...
     */
    [[nodiscard]] static auto from_url(const std::string& url)
        -> result<azure_destination_config>;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CLOUD_CLOUD_CONFIG_H
