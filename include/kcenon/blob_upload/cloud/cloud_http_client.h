/**
 * @file cloud_http_client.h
 * @brief network_system HTTP transport for the Azure destination
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_UPLOAD_CLOUD_CLOUD_HTTP_CLIENT_H
#define KCENON_BLOB_UPLOAD_CLOUD_CLOUD_HTTP_CLIENT_H

#include "azure_blob_destination.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief azure_http_client_interface over network_system's http_client
 *
 * Without network_system every call returns http_client_unavailable.
 *
 * @note Safe for concurrent requests from several chunk workers.
 */
class cloud_http_client : public azure_http_client_interface {
public:
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto put(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> override;

    [[nodiscard]] auto del(const std::string& url,
                           const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> override;

    [[nodiscard]] auto head(const std::string& url,
                            const std::map<std::string, std::string>& headers)
        -> result<azure_http_response> override;

    /**
     * @brief Whether a real transport was compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CLOUD_CLOUD_HTTP_CLIENT_H
