#include "proxy/ProxyDispatcher.hpp"
#include "core/GatewayError.hpp"
#include "docker/ContainerRuntime.hpp"
#include "registry/ContainerView.hpp"
#include <boost/beast/core/string.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

using namespace dockgate;
using json = nlohmann::json;
namespace beast = boost::beast;

static constexpr const char* ALLOWED_METHODS[] = {
    "GET", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"
};

static size_t body_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Collects "Name: value" lines. A status line starts a new response (a
// redirect hop or an interim 1xx) so the previous block is discarded.
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* out = static_cast<HeaderList*>(userdata);
    const size_t n = size * nitems;

    std::string line(buffer, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        out->clear();
        return n;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return n;

    std::string value = line.substr(colon + 1);
    size_t b = value.find_first_not_of(" \t");
    size_t e = value.find_last_not_of(" \t");
    value = (b == std::string::npos) ? std::string() : value.substr(b, e - b + 1);

    out->emplace_back(line.substr(0, colon), std::move(value));
    return n;
}

static ProxyResponse bad_gateway(const std::string& detail) {
    ProxyResponse r;
    r.status       = 502;
    r.content_type = "application/json";
    r.body         = json{{"detail", detail}}.dump();
    r.headers      = {{"content-type", "application/json"}};
    return r;
}

ProxyDispatcher::ProxyDispatcher(ContainerRuntime& runtime, std::chrono::seconds upstream_timeout)
    : runtime_(runtime), timeout_(upstream_timeout) {}

bool ProxyDispatcher::method_allowed(std::string_view method) {
    beast::string_view m(method.data(), method.size());
    for (const char* allowed : ALLOWED_METHODS) {
        if (beast::iequals(m, allowed)) return true;
    }
    return false;
}

std::string ProxyDispatcher::upstream_url(uint16_t port, const std::string& sub_path, const std::string& query) {
    size_t start = sub_path.find_first_not_of('/');
    std::string url = "http://127.0.0.1:" + std::to_string(port) + "/";
    if (start != std::string::npos) url += sub_path.substr(start);
    if (!query.empty()) url += "?" + query;
    return url;
}

uint16_t ProxyDispatcher::resolve_port(const std::string& container_id) const {
    ContainerDescriptor d = describe(runtime_.inspect(container_id));
    if (!d.host_port) {
        throw GatewayError(ErrorKind::NoPublishedPort, "Container has no published port");
    }
    return *d.host_port;
}

std::string ProxyDispatcher::upstream_base(const std::string& container_id) const {
    return "http://127.0.0.1:" + std::to_string(resolve_port(container_id));
}

ProxyResponse ProxyDispatcher::forward(const std::string& container_id, const ProxyRequest& req) const {
    const uint16_t port = resolve_port(container_id);
    return send_upstream(upstream_url(port, req.sub_path, req.query), req);
}

ProxyResponse ProxyDispatcher::send_upstream(const std::string& url, const ProxyRequest& req) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> c(curl_easy_init(), &curl_easy_cleanup);
    if (!c) return bad_gateway("curl_easy_init failed");

    // ---------------------------------------------------------------------------
    // Request headers: hop-by-hop removed. content-length and expect belong
    // to this leg and are recomputed by the transport. The empty "Expect:"
    // and "Content-Type:" entries stop libcurl adding its own defaults so
    // the upstream sees only what the client sent.
    // ---------------------------------------------------------------------------
    struct curl_slist* raw = nullptr;
    bool has_content_type = false;
    for (const auto& h : filter_hop_by_hop(req.headers)) {
        if (beast::iequals(h.first, "content-length") || beast::iequals(h.first, "expect")) continue;
        if (beast::iequals(h.first, "content-type")) has_content_type = true;
        std::string line = h.second.empty() ? h.first + ";" : h.first + ": " + h.second;
        raw = curl_slist_append(raw, line.c_str());
    }
    raw = curl_slist_append(raw, "Expect:");
    if (!has_content_type) raw = curl_slist_append(raw, "Content-Type:");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw, &curl_slist_free_all);

    ProxyResponse res;
    HeaderList    upstream_headers;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(c.get(), CURLOPT_URL,            url.c_str());
    curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER,     headers.get());
    curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION,  body_cb);
    curl_easy_setopt(c.get(), CURLOPT_WRITEDATA,      &res.body);
    curl_easy_setopt(c.get(), CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(c.get(), CURLOPT_HEADERDATA,     &upstream_headers);
    curl_easy_setopt(c.get(), CURLOPT_ERRORBUFFER,    errbuf);
    curl_easy_setopt(c.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.get(), CURLOPT_MAXREDIRS,      20L);
    curl_easy_setopt(c.get(), CURLOPT_TIMEOUT,        static_cast<long>(timeout_.count()));
    curl_easy_setopt(c.get(), CURLOPT_NOSIGNAL,       1L);

    // POST goes through CURLOPT_POST so a 301/302/303 turns it into a GET,
    // like a browser would. Every other method is sent as-is.
    const bool has_body = !req.body.empty();
    if (req.method == "GET" && !has_body) {
        curl_easy_setopt(c.get(), CURLOPT_HTTPGET, 1L);
    } else {
        if (req.method == "POST") curl_easy_setopt(c.get(), CURLOPT_POST, 1L);
        else curl_easy_setopt(c.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());

        if (has_body || req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
            curl_easy_setopt(c.get(), CURLOPT_POSTFIELDS,         req.body.data());
            curl_easy_setopt(c.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        }
    }

    CURLcode rc = curl_easy_perform(c.get());
    if (rc != CURLE_OK) {
        std::string err = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        std::cerr << "[PROXY] " << req.method << " " << url << " failed: " << err << "\n";
        return bad_gateway(err);
    }

    long status = 0;
    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &status);
    res.status  = static_cast<unsigned>(status);
    res.headers = filter_hop_by_hop(upstream_headers);

    if (const std::string* ct = find_header(res.headers, "content-type")) res.content_type = *ct;
    return res;
}
