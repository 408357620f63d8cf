/**
 * HttpSupport.cpp - Endpoint parsing, client setup, error text
 */

#include "net/HttpSupport.hpp"

namespace volley::net {

Endpoint parseEndpoint(const std::string& url) {
    Endpoint endpoint;

    size_t scheme_end = url.find("://");
    size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', host_start);

    if (path_start == std::string::npos) {
        endpoint.origin = url;
    } else {
        endpoint.origin = url.substr(0, path_start);
        endpoint.base_path = url.substr(path_start);
    }

    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
        endpoint.base_path.pop_back();
    }
    return endpoint;
}

std::unique_ptr<httplib::Client> makeClient(const Endpoint& endpoint, int timeout_ms) {
    auto client = std::make_unique<httplib::Client>(endpoint.origin);
    client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    return client;
}

httplib::Headers bearer(const std::string& api_key) {
    httplib::Headers headers;
    if (!api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key);
    }
    return headers;
}

bool isSuccess(const httplib::Result& result) {
    return result && result->status >= 200 && result->status < 300;
}

std::string describeFailure(const httplib::Result& result) {
    if (!result) {
        return "request failed: " + httplib::to_string(result.error());
    }
    std::string body = result->body.substr(0, 200);
    return "HTTP " + std::to_string(result->status) + (body.empty() ? "" : ": " + body);
}

} // namespace volley::net
