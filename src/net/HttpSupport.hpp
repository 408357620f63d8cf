/**
 * HttpSupport.hpp - Shared cpp-httplib plumbing for the collaborator adapters
 */

#pragma once

#include <httplib.h>

#include <memory>
#include <string>

namespace volley::net {

struct Endpoint {
    std::string origin;     // scheme://host[:port]
    std::string base_path;  // "" or "/v1", never a trailing slash
};

// "http://localhost:8080/v1/" -> {"http://localhost:8080", "/v1"}
Endpoint parseEndpoint(const std::string& url);

std::unique_ptr<httplib::Client> makeClient(const Endpoint& endpoint, int timeout_ms);

httplib::Headers bearer(const std::string& api_key);

// Human readable failure for a result that is not a 2xx response
std::string describeFailure(const httplib::Result& result);

bool isSuccess(const httplib::Result& result);

} // namespace volley::net
