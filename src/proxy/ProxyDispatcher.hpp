#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "proxy/HeaderFilter.hpp"

namespace dockgate {

class ContainerRuntime;

struct ProxyRequest {
    std::string method;     // GET POST PUT PATCH DELETE OPTIONS
    std::string sub_path;   // raw, as received, no leading '/' required
    std::string query;      // raw query string without '?'
    std::string body;
    HeaderList  headers;
};

struct ProxyResponse {
    unsigned    status{0};
    HeaderList  headers;
    std::string body;
    std::string content_type;
};

// ---------------------------------------------------------------------------
// Reverse proxy to 127.0.0.1:<bound_host_port>.
//
// The host port is re-resolved from a fresh inspection on every call; nothing
// is cached. Each forward opens its own upstream connection (no pooling,
// the target is always loopback).
//
// Errors:
//   container unknown          → GatewayError(ContainerNotFound), thrown
//   no live port binding       → GatewayError(NoPublishedPort), thrown, no
//                                upstream connection attempted
//   upstream transport failure → returned as a 502 ProxyResponse with
//                                {"detail": "..."}; never thrown
// ---------------------------------------------------------------------------
class ProxyDispatcher {
public:
    ProxyDispatcher(ContainerRuntime& runtime, std::chrono::seconds upstream_timeout);

    ProxyResponse forward(const std::string& container_id, const ProxyRequest& req) const;

    // "http://127.0.0.1:<port>" for the container's live binding.
    std::string upstream_base(const std::string& container_id) const;

    static std::string upstream_url(uint16_t port, const std::string& sub_path, const std::string& query);
    static bool method_allowed(std::string_view method);

private:
    uint16_t      resolve_port(const std::string& container_id) const;
    ProxyResponse send_upstream(const std::string& url, const ProxyRequest& req) const;

    ContainerRuntime&    runtime_;
    std::chrono::seconds timeout_;
};

} // namespace dockgate
