/**
 * @file azure_blob_destination.cpp
 * @brief Azure Blob Storage REST implementation of blob_destination
 * @version 0.1.0
 */

#include "kcenon/blob_upload/cloud/azure_blob_destination.h"

#include "kcenon/blob_upload/cloud/cloud_utils.h"
#include "kcenon/blob_upload/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace kcenon::blob_upload {

using cloud_utils::base64_decode;
using cloud_utils::base64_encode;
using cloud_utils::extract_xml_element;
using cloud_utils::get_rfc1123_time;
using cloud_utils::hmac_sha256;
using cloud_utils::url_encode;

auto azure_http_response::get_header(const std::string& name) const
    -> std::optional<std::string> {
    return cloud_utils::find_header(headers, name);
}

namespace {

using header_map = std::map<std::string, std::string>;

enum class http_method { put, del, head };

auto method_name(http_method method) -> const char* {
    switch (method) {
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
    }
    return "PUT";
}

/**
 * @brief One logical request, replayed for each retry attempt
 */
struct azure_request {
    const char* operation = "";
    http_method method = http_method::put;
    header_map query;
    header_map headers;

    /// Binary body (blocks, pages, whole blob)
    body_stream* body = nullptr;

    /// Text body (block list XML)
    std::optional<std::string> text;
};

void add_content_headers(header_map& headers, const blob_http_headers& props) {
    auto set = [&headers](const char* name, const std::string& value) {
        if (!value.empty()) {
            headers[name] = value;
        }
    };
    set("x-ms-blob-content-type", props.content_type);
    set("x-ms-blob-content-encoding", props.content_encoding);
    set("x-ms-blob-content-language", props.content_language);
    set("x-ms-blob-content-disposition", props.content_disposition);
    set("x-ms-blob-cache-control", props.cache_control);
    set("x-ms-blob-content-md5", props.content_md5);
}

void add_metadata(header_map& headers, const blob_metadata& metadata) {
    for (const auto& [key, value] : metadata) {
        headers["x-ms-meta-" + key] = value;
    }
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Remote error carrying the status and the service's own message
 */
auto error_from_response(const char* operation, const azure_http_response& response)
    -> error {
    auto body = response.get_body_string();
    auto service_code = response.get_header("x-ms-error-code");
    if (!service_code) {
        service_code = extract_xml_element(body, "Code");
    }
    auto service_message = extract_xml_element(body, "Message");

    std::string message = std::string(operation) + " failed, status " +
                          std::to_string(response.status_code);
    if (service_code) {
        message += " " + *service_code;
    }
    if (service_message) {
        message += ": " + *service_message;
    }
    return error{error_code_from_status(response.status_code), message, response.status_code};
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct azure_blob_destination::impl {
    azure_destination_config config;
    std::shared_ptr<azure_http_client_interface> http_client;
    sleep_function sleep = [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    };

    auto build_url(const header_map& query) const -> std::string {
        std::string url = config.blob_url();
        char separator = '?';
        for (const auto& [key, value] : query) {
            url += separator;
            url += key + "=" + url_encode(value);
            separator = '&';
        }
        if (!config.account_key && config.sas_token) {
            url += separator;
            url += *config.sas_token;
        }
        return url;
    }

    auto string_to_sign(const std::string& method,
                        const header_map& query,
                        const header_map& headers,
                        uint64_t content_length) const -> std::string {
        std::ostringstream sts;
        sts << method << "\n";

        auto get_header = [&headers](const std::string& name) -> std::string {
            return cloud_utils::find_header(headers, name).value_or("");
        };

        sts << get_header("Content-Encoding") << "\n";
        sts << get_header("Content-Language") << "\n";
        // Since 2015-02-21 a zero length is signed as an empty line.
        sts << (content_length == 0 ? std::string() : std::to_string(content_length)) << "\n";
        sts << get_header("Content-MD5") << "\n";
        sts << get_header("Content-Type") << "\n";
        sts << get_header("Date") << "\n";
        sts << get_header("If-Modified-Since") << "\n";
        sts << get_header("If-Match") << "\n";
        sts << get_header("If-None-Match") << "\n";
        sts << get_header("If-Unmodified-Since") << "\n";
        sts << get_header("Range") << "\n";

        header_map ms_headers;
        for (const auto& [key, value] : headers) {
            auto lower_key = to_lower(key);
            if (lower_key.starts_with("x-ms-")) {
                ms_headers[lower_key] = value;
            }
        }
        for (const auto& [key, value] : ms_headers) {
            sts << key << ":" << value << "\n";
        }

        sts << "/" << config.account_name << "/" << config.container << "/"
            << url_encode(config.blob_name, false);

        header_map lowered_query;
        for (const auto& [key, value] : query) {
            lowered_query[to_lower(key)] = value;
        }
        for (const auto& [key, value] : lowered_query) {
            sts << "\n" << key << ":" << value;
        }

        return sts.str();
    }

    auto authorization(const std::string& method,
                       const header_map& query,
                       const header_map& headers,
                       uint64_t content_length) const -> std::string {
        auto key_bytes = base64_decode(*config.account_key);
        auto signature = hmac_sha256(key_bytes,
                                     string_to_sign(method, query, headers, content_length));
        return "SharedKey " + config.account_name + ":" + base64_encode(signature);
    }

    auto send_once(const azure_request& request, const std::vector<uint8_t>& payload)
        -> result<azure_http_response> {
        header_map headers = request.headers;
        headers["x-ms-version"] = config.api_version;
        headers["x-ms-date"] = get_rfc1123_time();

        uint64_t content_length = 0;
        if (request.method == http_method::put) {
            content_length = request.text ? request.text->size() : payload.size();
            headers["Content-Length"] = std::to_string(content_length);
        }

        if (config.account_key) {
            headers["Authorization"] = authorization(method_name(request.method),
                                                     request.query, headers, content_length);
        }

        auto url = build_url(request.query);
        switch (request.method) {
            case http_method::put:
                if (request.text) {
                    return http_client->put(url, *request.text, headers);
                }
                return http_client->put(url, payload, headers);
            case http_method::del:
                return http_client->del(url, headers);
            case http_method::head:
                return http_client->head(url, headers);
        }
        return unexpected{error{error_code::internal_error, "unknown HTTP method"}};
    }

    /**
     * @brief Send with retries; returns the last response whatever its status
     */
    auto execute(const azure_request& request, const cancellation_token& token)
        -> result<azure_http_response> {
        const auto& policy = config.retry;

        for (std::size_t attempt = 1;; ++attempt) {
            if (token.is_cancelled()) {
                return unexpected{error{error_code::transfer_cancelled,
                    std::string(request.operation) + " skipped: transfer cancelled"}};
            }

            std::vector<uint8_t> payload;
            if (request.body) {
                auto drained = read_all(*request.body);
                if (!drained) {
                    return unexpected{drained.error()};
                }
                payload = std::move(drained.value());
            }

            auto response = send_once(request, payload);
            bool last_attempt = attempt >= policy.max_attempts;

            if (!response) {
                if (!policy.retry_on_connection_error || last_attempt) {
                    return unexpected{error{error_code::connection_failed,
                        std::string(request.operation) + " failed: " +
                            response.error().message}};
                }
                BU_LOG_WARN(log_category::destination,
                            std::string(request.operation) + " attempt " +
                                std::to_string(attempt) + " got no response: " +
                                response.error().message);
            } else if (cloud_utils::is_retryable_status(response.value().status_code, policy) &&
                       !last_attempt) {
                BU_LOG_WARN(log_category::destination,
                            std::string(request.operation) + " attempt " +
                                std::to_string(attempt) + " returned " +
                                std::to_string(response.value().status_code) + ", retrying");
            } else {
                return response;
            }

            sleep(cloud_utils::calculate_retry_delay(policy, attempt));
        }
    }

    auto expect(const azure_request& request,
                const cancellation_token& token,
                std::initializer_list<int> accepted) -> result<azure_http_response> {
        auto response = execute(request, token);
        if (!response) {
            return response;
        }
        auto status = response.value().status_code;
        if (std::find(accepted.begin(), accepted.end(), status) == accepted.end()) {
            return unexpected{error_from_response(request.operation, response.value())};
        }
        return response;
    }
};

// ============================================================================
// azure_blob_destination
// ============================================================================

azure_blob_destination::azure_blob_destination(
    const azure_destination_config& config,
    std::shared_ptr<azure_http_client_interface> http_client)
    : impl_(std::make_unique<impl>()) {
    impl_->config = config;
    impl_->http_client = std::move(http_client);
}

azure_blob_destination::~azure_blob_destination() = default;

auto azure_blob_destination::create(const azure_destination_config& config,
                                    std::shared_ptr<azure_http_client_interface> http_client)
    -> result<std::shared_ptr<azure_blob_destination>> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    if (!http_client) {
        return unexpected{error{error_code::http_client_unavailable,
                                "an HTTP client is required"}};
    }
    return std::shared_ptr<azure_blob_destination>(
        new azure_blob_destination(config, std::move(http_client)));
}

auto azure_blob_destination::name() const -> std::string {
    return impl_->config.blob_url();
}

auto azure_blob_destination::get_properties(const cancellation_token& token)
    -> result<blob_properties> {
    azure_request request;
    request.operation = "Get Blob Properties";
    request.method = http_method::head;

    auto response = impl_->execute(request, token);
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (resp.status_code == 404) {
        return unexpected{error{error_code::blob_not_found,
                                "blob not found: " + impl_->config.blob_name, 404}};
    }
    if (resp.status_code != 200) {
        return unexpected{error_from_response(request.operation, resp)};
    }

    blob_properties props;
    if (auto length = resp.get_header("Content-Length")) {
        props.content_length = std::strtoull(length->c_str(), nullptr, 10);
    }
    props.blob_type = resp.get_header("x-ms-blob-type").value_or("");
    props.etag = resp.get_header("ETag").value_or("");
    props.access_tier = resp.get_header("x-ms-access-tier").value_or("");
    return props;
}

auto azure_blob_destination::create_page_blob(uint64_t size,
                                              const blob_http_headers& headers,
                                              const blob_metadata& metadata,
                                              const cancellation_token& token)
    -> result<void> {
    azure_request request;
    request.operation = "Create Page Blob";
    request.headers["x-ms-blob-type"] = "PageBlob";
    request.headers["x-ms-blob-content-length"] = std::to_string(size);
    add_content_headers(request.headers, headers);
    add_metadata(request.headers, metadata);

    auto response = impl_->expect(request, token, {201});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::stage_block(const std::string& block_id,
                                         body_stream& body,
                                         const cancellation_token& token) -> result<void> {
    azure_request request;
    request.operation = "Put Block";
    request.query["comp"] = "block";
    request.query["blockid"] = block_id;
    request.headers["Content-Type"] = "application/octet-stream";
    request.body = &body;

    auto response = impl_->expect(request, token, {201});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::upload_pages(uint64_t offset,
                                          body_stream& body,
                                          const cancellation_token& token) -> result<void> {
    if (body.size() == 0) {
        return unexpected{error{error_code::source_range_error, "empty page range"}};
    }

    azure_request request;
    request.operation = "Put Page";
    request.query["comp"] = "page";
    request.headers["x-ms-page-write"] = "update";
    request.headers["x-ms-range"] = "bytes=" + std::to_string(offset) + "-" +
                                    std::to_string(offset + body.size() - 1);
    request.headers["Content-Type"] = "application/octet-stream";
    request.body = &body;

    auto response = impl_->expect(request, token, {201});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::commit_block_list(const std::vector<std::string>& block_ids,
                                               const blob_http_headers& headers,
                                               const blob_metadata& metadata,
                                               const cancellation_token& token)
    -> result<void> {
    std::ostringstream xml_body;
    xml_body << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    xml_body << "<BlockList>\n";
    for (const auto& block_id : block_ids) {
        xml_body << "  <Latest>" << block_id << "</Latest>\n";
    }
    xml_body << "</BlockList>";

    azure_request request;
    request.operation = "Put Block List";
    request.query["comp"] = "blocklist";
    request.headers["Content-Type"] = "application/xml";
    add_content_headers(request.headers, headers);
    add_metadata(request.headers, metadata);
    request.text = xml_body.str();

    auto response = impl_->expect(request, token, {201});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::upload(body_stream& body,
                                    const blob_http_headers& headers,
                                    const blob_metadata& metadata,
                                    const cancellation_token& token) -> result<void> {
    azure_request request;
    request.operation = "Put Blob";
    request.headers["x-ms-blob-type"] = "BlockBlob";
    request.headers["Content-Type"] = "application/octet-stream";
    add_content_headers(request.headers, headers);
    add_metadata(request.headers, metadata);
    request.body = &body;

    auto response = impl_->expect(request, token, {201});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::set_tier(std::string_view tier, const cancellation_token& token)
    -> result<void> {
    azure_request request;
    request.operation = "Set Blob Tier";
    request.query["comp"] = "tier";
    request.headers["x-ms-access-tier"] = std::string(tier);

    auto response = impl_->expect(request, token, {200, 202});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_blob_destination::delete_blob(const cancellation_token& token) -> result<void> {
    azure_request request;
    request.operation = "Delete Blob";
    request.method = http_method::del;
    request.headers["x-ms-delete-snapshots"] = "include";

    auto response = impl_->expect(request, token, {202});
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

void azure_blob_destination::set_sleep_function(sleep_function sleep) {
    impl_->sleep = std::move(sleep);
}

auto azure_blob_destination::config() const -> const azure_destination_config& {
    return impl_->config;
}

auto azure_blob_destination::string_to_sign(const std::string& method,
                                            const std::map<std::string, std::string>& query,
                                            const std::map<std::string, std::string>& headers,
                                            uint64_t content_length) const -> std::string {
    return impl_->string_to_sign(method, query, headers, content_length);
}

}  // namespace kcenon::blob_upload
