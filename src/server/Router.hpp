#pragma once
#include <memory>
#include <string>
#include <vector>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "docker/ContainerRuntime.hpp"

namespace dockgate {

class ContainerService;
class ProxyDispatcher;

namespace http = boost::beast::http;

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// A finished response, or the header of a chunked one whose body is pulled
// from stream by the server.
struct RouteResult {
    Response                     response;
    std::unique_ptr<ChunkSource> stream;
};

// ---------------------------------------------------------------------------
// HTTP surface. Maps a parsed request onto the container service or the
// proxy and turns every failure into {"detail": "..."} with the status of
// its ErrorKind. Nothing thrown below escapes handle().
//
//   GET    /healthz
//   GET    /images                      POST /images/pull
//   GET    /containers                  POST /containers/run
//   GET    /containers/{id}             DELETE /containers/{id}?force=
//   POST   /containers/{id}/stop        POST /containers/{id}/start
//   GET    /containers/{id}/logs?tail=&follow=
//   POST   /containers/{id}/exec
//   GET    /proxy/{id}
//   *      /proxy/{id}/{path...}
// ---------------------------------------------------------------------------
class Router {
public:
    Router(ContainerService& service, ProxyDispatcher& proxy);

    RouteResult handle(const Request& req);

    static Response json_response(const Request& req, http::status status, const nlohmann::json& body);
    static Response error_response(const Request& req, unsigned status, const std::string& detail);

private:
    RouteResult dispatch(const Request& req,
                         const std::string& path,
                         const std::string& query);

    RouteResult containers(const Request& req,
                           const std::vector<std::string>& seg,
                           const std::string& query);

    RouteResult proxy(const Request& req, const std::string& rest, const std::string& query);
    RouteResult logs(const Request& req, const std::string& id, const std::string& query);

    ContainerService& service_;
    ProxyDispatcher&  proxy_;
};

} // namespace dockgate
