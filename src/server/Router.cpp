#include "server/Router.hpp"
#include "core/GatewayError.hpp"
#include "net/UrlCodec.hpp"
#include "proxy/ProxyDispatcher.hpp"
#include "registry/ContainerView.hpp"
#include "service/ContainerService.hpp"
#include "service/RunRequest.hpp"
#include <boost/beast/core/string.hpp>
#include <iostream>

using namespace dockgate;
using json = nlohmann::json;
namespace beast = boost::beast;

static constexpr const char* SERVER_NAME = "dockgate";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> seg;
    size_t i = 0;
    while (i < path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        if (j > i) seg.push_back(url_decode(path.substr(i, j - i)));
        i = j + 1;
    }
    return seg;
}

static json parse_body(const Request& req) {
    if (req.body().empty()) {
        throw GatewayError(ErrorKind::InvalidRequest, "request body must be a JSON object");
    }
    json body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        throw GatewayError(ErrorKind::InvalidRequest, "request body is not valid JSON");
    }
    return body;
}

static bool query_flag(const std::map<std::string, std::string>& q, const char* key, bool dflt) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return dflt;
    beast::string_view v(it->second.data(), it->second.size());
    if (beast::iequals(v, "true") || v == "1" || beast::iequals(v, "yes") || beast::iequals(v, "on")) return true;
    if (beast::iequals(v, "false") || v == "0" || beast::iequals(v, "no") || beast::iequals(v, "off")) return false;
    throw GatewayError(ErrorKind::InvalidRequest, std::string(key) + " must be a boolean");
}

// tail=N or tail=all
static std::optional<int> query_tail(const std::map<std::string, std::string>& q) {
    auto it = q.find("tail");
    if (it == q.end() || it->second.empty() || it->second == "all") return std::nullopt;
    try {
        size_t used = 0;
        int n = std::stoi(it->second, &used);
        if (used == it->second.size() && n >= 0) return n;
    } catch (const std::exception&) {
    }
    throw GatewayError(ErrorKind::InvalidRequest, "tail must be a non-negative integer or 'all'");
}

static json image_json(const ImageInfo& img) {
    return json{{"id", img.id}, {"repo_tags", img.repo_tags}, {"size", img.size}};
}

static RouteResult done(Response res) {
    return RouteResult{std::move(res), nullptr};
}

// ---------------------------------------------------------------------------
Router::Router(ContainerService& service, ProxyDispatcher& proxy)
    : service_(service), proxy_(proxy) {}

Response Router::json_response(const Request& req, http::status status, const json& body) {
    Response res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

Response Router::error_response(const Request& req, unsigned status, const std::string& detail) {
    Response res{static_cast<http::status>(status), req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = json{{"detail", detail}}.dump();
    res.prepare_payload();
    return res;
}

RouteResult Router::handle(const Request& req) {
    const std::string target(req.target());
    const size_t q = target.find('?');
    const std::string path  = target.substr(0, q);
    const std::string query = (q == std::string::npos) ? std::string() : target.substr(q + 1);

    try {
        return dispatch(req, path, query);
    } catch (const GatewayError& e) {
        if (e.status() >= 500) {
            std::cerr << "[GATEWAY] " << req.method_string() << " " << path << " -> "
                      << to_string(e.kind()) << ": " << e.what() << "\n";
        }
        return done(error_response(req, e.status(), e.what()));
    } catch (const std::exception& e) {
        std::cerr << "[GATEWAY] " << req.method_string() << " " << path
                  << " -> unhandled: " << e.what() << "\n";
        return done(error_response(req, 500, e.what()));
    }
}

RouteResult Router::dispatch(const Request& req, const std::string& path, const std::string& query) {
    static const std::string PROXY_PREFIX = "/proxy/";
    if (path.rfind(PROXY_PREFIX, 0) == 0 && path.size() > PROXY_PREFIX.size()) {
        return proxy(req, path.substr(PROXY_PREFIX.size()), query);
    }

    const std::vector<std::string> seg = split_path(path);
    const http::verb method = req.method();

    if (seg.size() == 1 && seg[0] == "healthz") {
        if (method != http::verb::get) return done(error_response(req, 405, "Method Not Allowed"));
        try {
            service_.ping();
        } catch (const std::exception& e) {
            return done(error_response(req, 500, e.what()));
        }
        return done(json_response(req, http::status::ok, json{{"ok", true}}));
    }

    if (!seg.empty() && seg[0] == "images") {
        if (seg.size() == 1) {
            if (method != http::verb::get) return done(error_response(req, 405, "Method Not Allowed"));
            json arr = json::array();
            for (const auto& img : service_.list_images()) arr.push_back(image_json(img));
            return done(json_response(req, http::status::ok, arr));
        }
        if (seg.size() == 2 && seg[1] == "pull") {
            if (method != http::verb::post) return done(error_response(req, 405, "Method Not Allowed"));
            json body = parse_body(req);
            if (!body.is_object() || !body.contains("image") || !body["image"].is_string()) {
                throw GatewayError(ErrorKind::InvalidRequest, "image is required");
            }
            std::string id = service_.pull_image(body["image"].get<std::string>());
            return done(json_response(req, http::status::ok, json{{"id", id}}));
        }
    }

    if (!seg.empty() && seg[0] == "containers") {
        return containers(req, seg, query);
    }

    return done(error_response(req, 404, "Not Found"));
}

RouteResult Router::containers(const Request& req,
                               const std::vector<std::string>& seg,
                               const std::string& query) {
    const http::verb method = req.method();
    const auto not_allowed = [&]() { return done(error_response(req, 405, "Method Not Allowed")); };

    if (seg.size() == 1) {
        if (method != http::verb::get) return not_allowed();
        json arr = json::array();
        for (const auto& d : service_.list()) arr.push_back(to_json(d));
        return done(json_response(req, http::status::ok, arr));
    }

    if (seg.size() == 2 && seg[1] == "run") {
        if (method != http::verb::post) return not_allowed();
        RunRequest run = RunRequest::from_json(parse_body(req));
        return done(json_response(req, http::status::ok, to_json(service_.run(run))));
    }

    const std::string& id = seg[1];

    if (seg.size() == 2) {
        if (method == http::verb::get) {
            return done(json_response(req, http::status::ok, to_json(service_.get(id))));
        }
        if (method == http::verb::delete_) {
            bool force = query_flag(parse_query(query), "force", false);
            service_.remove(id, force);
            return done(json_response(req, http::status::ok, json{{"id", id}, {"removed", true}}));
        }
        return not_allowed();
    }

    if (seg.size() == 3) {
        const std::string& action = seg[2];
        if (action == "stop" || action == "start") {
            if (method != http::verb::post) return not_allowed();
            if (action == "stop") {
                service_.stop(id);
                return done(json_response(req, http::status::ok, json{{"id", id}, {"status", "stopped"}}));
            }
            service_.start(id);
            return done(json_response(req, http::status::ok, json{{"id", id}, {"status", "running"}}));
        }
        if (action == "logs") {
            if (method != http::verb::get) return not_allowed();
            return logs(req, id, query);
        }
        if (action == "exec") {
            if (method != http::verb::post) return not_allowed();
            ExecResult r = service_.exec(id, exec_spec_from_json(parse_body(req)));
            json out = {{"id", id}, {"exit_code", r.exit_code}, {"stdout", r.stdout_text}};
            out["stderr"] = r.stderr_text ? json(*r.stderr_text) : json(nullptr);
            return done(json_response(req, http::status::ok, out));
        }
    }

    return done(error_response(req, 404, "Not Found"));
}

// Header only; the server pulls the body from the stream chunk by chunk.
RouteResult Router::logs(const Request& req, const std::string& id, const std::string& query) {
    auto q = parse_query(query);
    std::optional<int> tail = query_tail(q);
    bool follow = query_flag(q, "follow", false);

    RouteResult out;
    out.stream = service_.logs(id, tail, follow);

    out.response = Response{http::status::ok, req.version()};
    out.response.set(http::field::server, SERVER_NAME);
    out.response.set(http::field::content_type, "text/plain; charset=utf-8");
    out.response.set(http::field::cache_control, "no-cache");
    out.response.keep_alive(req.keep_alive());
    out.response.chunked(true);
    return out;
}

// rest is everything after "/proxy/": "<id>" or "<id>/<sub path>"
RouteResult Router::proxy(const Request& req, const std::string& rest, const std::string& query) {
    const size_t slash = rest.find('/');
    const std::string id = url_decode(rest.substr(0, slash));
    if (id.empty()) return done(error_response(req, 404, "Not Found"));

    if (slash == std::string::npos) {
        if (req.method() != http::verb::get) return done(error_response(req, 405, "Method Not Allowed"));
        return done(json_response(req, http::status::ok,
                                  json{{"container_id", id}, {"upstream", proxy_.upstream_base(id)}}));
    }

    ProxyRequest preq;
    preq.method = std::string(req.method_string());
    if (!ProxyDispatcher::method_allowed(preq.method)) {
        return done(error_response(req, 405, "Method Not Allowed"));
    }
    preq.sub_path = rest.substr(slash + 1);
    preq.query    = query;
    preq.body     = req.body();
    for (const auto& f : req) {
        preq.headers.emplace_back(std::string(f.name_string()), std::string(f.value()));
    }

    ProxyResponse up = proxy_.forward(id, preq);

    Response res{static_cast<http::status>(up.status), req.version()};
    for (const auto& h : up.headers) {
        if (beast::iequals(h.first, "content-length")) continue;
        res.insert(beast::string_view(h.first.data(), h.first.size()),
                   beast::string_view(h.second.data(), h.second.size()));
    }
    if (!up.content_type.empty()) res.set(http::field::content_type, up.content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(up.body);
    res.prepare_payload();
    return done(std::move(res));
}
