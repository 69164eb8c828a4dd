/**
 * @file cloud_config.cpp
 * @brief Azure destination configuration parsing
 * @version 0.1.0
 */

#include "kcenon/blob_upload/cloud/cloud_config.h"

#include "kcenon/blob_upload/cloud/cloud_utils.h"

namespace kcenon::blob_upload {

namespace {

struct connection_info {
    std::string account_name;
    std::string account_key;
    std::string endpoint_suffix;
    std::string sas_token;
    std::string blob_endpoint;
};

auto parse_connection_string(const std::string& conn_str) -> connection_info {
    connection_info info;

    std::size_t pos = 0;
    while (pos < conn_str.size()) {
        auto eq_pos = conn_str.find('=', pos);
        if (eq_pos == std::string::npos) break;

        std::string key = conn_str.substr(pos, eq_pos - pos);
        std::string value;

        auto semi_pos = conn_str.find(';', eq_pos);
        if (semi_pos == std::string::npos) {
            value = conn_str.substr(eq_pos + 1);
            pos = conn_str.size();
        } else {
            value = conn_str.substr(eq_pos + 1, semi_pos - eq_pos - 1);
            pos = semi_pos + 1;
        }

        if (key == "AccountName") {
            info.account_name = value;
        } else if (key == "AccountKey") {
            info.account_key = value;
        } else if (key == "EndpointSuffix") {
            info.endpoint_suffix = value;
        } else if (key == "SharedAccessSignature") {
            info.sas_token = value;
        } else if (key == "BlobEndpoint") {
            info.blob_endpoint = value;
        }
    }

    return info;
}

}  // namespace

auto azure_destination_config::validate() const -> result<void> {
    if (account_name.empty() && !endpoint.has_value()) {
        return unexpected{error{error_code::missing_destination, "account name is required"}};
    }
    if (container.empty()) {
        return unexpected{error{error_code::missing_destination, "container is required"}};
    }
    if (blob_name.empty()) {
        return unexpected{error{error_code::missing_destination, "blob name is required"}};
    }
    if ((!account_key || account_key->empty()) && (!sas_token || sas_token->empty())) {
        return unexpected{error{error_code::missing_credentials,
                                "an account key or a SAS token is required"}};
    }
    if (account_key && !account_key->empty() && account_name.empty()) {
        return unexpected{error{error_code::missing_credentials,
                                "SharedKey signing needs the account name"}};
    }
    if (retry.max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry.max_attempts must be at least 1"}};
    }
    return {};
}

auto azure_destination_config::endpoint_url() const -> std::string {
    if (endpoint.has_value()) {
        auto url = endpoint.value();
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
    std::string protocol = use_ssl ? "https" : "http";
    return protocol + "://" + account_name + ".blob." + endpoint_suffix;
}

auto azure_destination_config::blob_url() const -> std::string {
    return endpoint_url() + "/" + container + "/" + cloud_utils::url_encode(blob_name, false);
}

auto azure_destination_config::from_connection_string(const std::string& connection_string,
                                                      const std::string& container,
                                                      const std::string& blob_name)
    -> result<azure_destination_config> {
    auto info = parse_connection_string(connection_string);

    azure_destination_config config;
    config.account_name = info.account_name;
    config.container = container;
    config.blob_name = blob_name;
    if (!info.endpoint_suffix.empty()) {
        config.endpoint_suffix = info.endpoint_suffix;
    }
    if (!info.blob_endpoint.empty()) {
        config.endpoint = info.blob_endpoint;
    }
    if (!info.account_key.empty()) {
        config.account_key = info.account_key;
    }
    if (!info.sas_token.empty()) {
        config.sas_token = info.sas_token.front() == '?' ? info.sas_token.substr(1)
                                                         : info.sas_token;
    }

    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return config;
}

auto azure_destination_config::from_url(const std::string& url)
    -> result<azure_destination_config> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return unexpected{error{error_code::missing_destination, "not a URL: " + url}};
    }

    azure_destination_config config;
    std::string scheme = url.substr(0, scheme_end);
    config.use_ssl = scheme == "https";

    std::string rest = url.substr(scheme_end + 3);
    std::string query;
    auto query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        query = rest.substr(query_pos + 1);
        rest = rest.substr(0, query_pos);
    }

    auto host_end = rest.find('/');
    if (host_end == std::string::npos) {
        return unexpected{error{error_code::missing_destination,
                                "URL has no container: " + url}};
    }
    std::string host = rest.substr(0, host_end);
    std::string path = rest.substr(host_end + 1);

    auto container_end = path.find('/');
    if (container_end == std::string::npos || container_end + 1 >= path.size()) {
        return unexpected{error{error_code::missing_destination,
                                "URL has no blob name: " + url}};
    }
    config.container = path.substr(0, container_end);
    config.blob_name = cloud_utils::url_decode(path.substr(container_end + 1));

    auto blob_marker = host.find(".blob.");
    if (blob_marker != std::string::npos) {
        config.account_name = host.substr(0, blob_marker);
        config.endpoint_suffix = host.substr(blob_marker + 6);
    } else {
        // Emulator or custom domain: keep the host as the endpoint.
        config.endpoint = scheme + "://" + host;
    }

    if (!query.empty()) {
        config.sas_token = query;
    }

    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return config;
}

}  // namespace kcenon::blob_upload
