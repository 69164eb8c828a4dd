/**
 * @file azure_blob_destination.h
 * @brief Azure Blob Storage REST implementation of blob_destination
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_CLOUD_AZURE_BLOB_DESTINATION_H
#define KCENON_BLOB_UPLOAD_CLOUD_AZURE_BLOB_DESTINATION_H

#include "blob_destination.h"
#include "cloud_config.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief HTTP response for Azure operations
 */
struct azure_http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Case-insensitive header lookup
     */
    [[nodiscard]] auto get_header(const std::string& name) const -> std::optional<std::string>;
};

/**
 * @brief HTTP client interface for Azure operations
 *
 * Injected so tests can replace the network with a mock. An error result
 * means no response was received.
 */
class azure_http_client_interface {
public:
    virtual ~azure_http_client_interface() = default;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> = 0;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::vector<uint8_t>& body,
                                   const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> = 0;

    [[nodiscard]] virtual auto del(const std::string& url,
                                   const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> = 0;

    [[nodiscard]] virtual auto head(const std::string& url,
                                    const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> = 0;
};

/**
 * @brief blob_destination over the Azure Blob REST API
 *
 * Requests carry x-ms-version and x-ms-date and are signed with SharedKey
 * when an account key is configured, or carry the SAS token otherwise.
 * Throttling, 5xx and transport failures are retried per the configured
 * cloud_retry_policy; bodies are rewound and re-read for each attempt.
 *
 * @code
 * auto config = azure_destination_config::from_url(
 *     "https://acct.blob.core.windows.net/disks/os.vhd?sv=...&sig=...");
 * auto dest = azure_blob_destination::create(config.value(), make_cloud_http_client());
 * @endcode
 */
class azure_blob_destination : public blob_destination {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Create a destination after validating the configuration
     * @param http_client Transport; required
     */
    [[nodiscard]] static auto create(const azure_destination_config& config,
                                     std::shared_ptr<azure_http_client_interface> http_client)
        -> result<std::shared_ptr<azure_blob_destination>>;

    ~azure_blob_destination() override;

    azure_blob_destination(const azure_blob_destination&) = delete;
    auto operator=(const azure_blob_destination&) -> azure_blob_destination& = delete;

    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto get_properties(const cancellation_token& token)
        -> result<blob_properties> override;

    [[nodiscard]] auto create_page_blob(uint64_t size,
                                        const blob_http_headers& headers,
                                        const blob_metadata& metadata,
                                        const cancellation_token& token)
        -> result<void> override;

    [[nodiscard]] auto stage_block(const std::string& block_id,
                                   body_stream& body,
                                   const cancellation_token& token) -> result<void> override;

    [[nodiscard]] auto upload_pages(uint64_t offset,
                                    body_stream& body,
                                    const cancellation_token& token) -> result<void> override;

    [[nodiscard]] auto commit_block_list(const std::vector<std::string>& block_ids,
                                         const blob_http_headers& headers,
                                         const blob_metadata& metadata,
                                         const cancellation_token& token)
        -> result<void> override;

    [[nodiscard]] auto upload(body_stream& body,
                              const blob_http_headers& headers,
                              const blob_metadata& metadata,
                              const cancellation_token& token) -> result<void> override;

    [[nodiscard]] auto set_tier(std::string_view tier, const cancellation_token& token)
        -> result<void> override;

    [[nodiscard]] auto delete_blob(const cancellation_token& token) -> result<void> override;

    /**
     * @brief Replace the wait between retries (tests use a no-op)
     */
    void set_sleep_function(sleep_function sleep);

    [[nodiscard]] auto config() const -> const azure_destination_config&;

    /**
     * @brief SharedKey string-to-sign for a request
     *
     * Exposed for verification against the service's documented examples.
     */
    [[nodiscard]] auto string_to_sign(const std::string& method,
                                      const std::map<std::string, std::string>& query,
                                      const std::map<std::string, std::string>& headers,
                                      uint64_t content_length) const -> std::string;

private:
    azure_blob_destination(const azure_destination_config& config,
                           std::shared_ptr<azure_http_client_interface> http_client);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CLOUD_AZURE_BLOB_DESTINATION_H
