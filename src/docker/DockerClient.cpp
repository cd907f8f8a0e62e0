#include "docker/DockerClient.hpp"
#include "docker/DockerLogStream.hpp"
#include "docker/LogFrameDecoder.hpp"
#include "net/UrlCodec.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using namespace dockgate;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Image names keep their '/' separators; the daemon routes /images/{name:.*}.
static std::string encode_image_path(const std::string& reference) {
    std::string out;
    size_t start = 0;
    while (true) {
        size_t slash = reference.find('/', start);
        out += url_encode(reference.substr(start, slash - start));
        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

static json parse_or_fail(const std::string& body, const std::string& op) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw GatewayError(ErrorKind::OperationFailed, op + ": runtime returned malformed JSON");
    }
    return j;
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

DockerClient::DockerClient(std::string socket_path, std::string api_version)
    : socket_path_(std::move(socket_path)), api_(std::move(api_version)) {
    std::cout << "[DOCKER] Engine API " << api_ << " via " << socket_path_ << "\n";
}

size_t DockerClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

DockerClient::Reply DockerClient::perform(const std::string& method,
                                          const std::string& path,
                                          const std::string& body,
                                          long timeout_secs) const {
    std::string url = "http://docker/" + api_ + path;

    // Only reads are retried. A create or start that timed out may still
    // have happened on the daemon side.
    const int attempts = (method == "GET") ? 3 : 1;

    std::string last_error;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) throw GatewayError(ErrorKind::RuntimeUnavailable, "curl_easy_init failed");

        struct curl_slist* raw_headers = nullptr;
        if (!body.empty()) raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, &curl_slist_free_all);

        Reply reply;
        char errbuf[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socket_path_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_URL,              url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,       headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,    write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,        &reply.body);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER,      errbuf);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,         1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,   5L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,          timeout_secs);

        if (method == "POST") {
            curl_easy_setopt(curl.get(), CURLOPT_POST,          1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,    body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        } else if (method != "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
        }

        CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &reply.status);
            return reply;
        }

        last_error = errbuf[0] ? errbuf : curl_easy_strerror(res);
        if (attempt < attempts - 1) {
            std::cout << "[DOCKER] Retry " << (attempt + 1) << "/" << attempts
                      << " " << method << " " << path << " (" << last_error << ")\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * (1 << attempt)));
        }
    }

    throw GatewayError(ErrorKind::RuntimeUnavailable,
                       "runtime control channel " + socket_path_ + " unreachable: " + last_error);
}

std::string DockerClient::message_of(const Reply& r) {
    json j = json::parse(r.body, nullptr, false);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) {
        return j["message"].get<std::string>();
    }
    return r.body.empty() ? "HTTP " + std::to_string(r.status) : r.body;
}

void DockerClient::fail(ErrorKind kind, const std::string& op, const Reply& r) {
    std::string msg = message_of(r);
    std::cerr << "[DOCKER] " << op << " failed (" << r.status << "): " << msg << "\n";
    if (kind == ErrorKind::OperationFailed) {
        throw GatewayError(kind, op + ": runtime returned " + std::to_string(r.status) + ": " + msg);
    }
    throw GatewayError(kind, msg);
}

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

void DockerClient::ping() {
    Reply r = perform("GET", "/_ping");
    if (r.status != 200) fail(ErrorKind::RuntimeUnavailable, "ping", r);
}

json DockerClient::create_body(const CreateSpec& spec) {
    const std::string port_key = std::to_string(spec.internal_port) + "/tcp";

    json host_config = {
        {"PortBindings", {
            {port_key, json::array({
                json{{"HostIp", "127.0.0.1"}, {"HostPort", std::to_string(spec.host_port)}}
            })}
        }},
        {"AutoRemove", spec.auto_remove}
    };

    // The daemon rejects AutoRemove combined with a restart policy.
    if (spec.restart_policy && !spec.auto_remove) {
        host_config["RestartPolicy"] = {{"Name", *spec.restart_policy}};
    }
    if (!spec.volumes.empty()) {
        json binds = json::array();
        for (const auto& v : spec.volumes) {
            binds.push_back(v.host_path + ":" + v.container_path + ":" + v.mode);
        }
        host_config["Binds"] = binds;
    }
    if (spec.network) host_config["NetworkMode"] = *spec.network;

    json env = json::array();
    for (const auto& [k, v] : spec.env) env.push_back(k + "=" + v);

    json body = {
        {"Image",        spec.image},
        {"Env",          env},
        {"Labels",       spec.labels},
        {"ExposedPorts", {{port_key, json::object()}}},
        {"HostConfig",   host_config}
    };
    if (!spec.command.empty()) body["Cmd"] = spec.command;
    return body;
}

std::string DockerClient::create(const CreateSpec& spec) {
    std::string path = "/containers/create";
    if (spec.name) path += "?name=" + url_encode(*spec.name);

    Reply r = perform("POST", path, create_body(spec).dump());
    switch (r.status) {
        case 201: break;
        case 404: fail(ErrorKind::ImageNotFound, "create", r);
        case 409: fail(ErrorKind::NameConflict, "create", r);
        case 400: fail(ErrorKind::InvalidRequest, "create", r);
        default:  fail(ErrorKind::OperationFailed, "create", r);
    }

    json j = parse_or_fail(r.body, "create");
    if (!j.contains("Id") || !j["Id"].is_string()) {
        throw GatewayError(ErrorKind::OperationFailed, "create: response carries no container id");
    }
    if (j.contains("Warnings") && j["Warnings"].is_array()) {
        for (const auto& w : j["Warnings"]) {
            if (w.is_string()) std::cout << "[DOCKER] create warning: " << w.get<std::string>() << "\n";
        }
    }
    return j["Id"].get<std::string>();
}

std::string DockerClient::create_and_start(const CreateSpec& spec) {
    std::string id;
    try {
        id = create(spec);
    } catch (const GatewayError& e) {
        if (e.kind() != ErrorKind::ImageNotFound) throw;
        std::cout << "[DOCKER] Image " << spec.image << " not present locally, pulling\n";
        pull_image(spec.image);
        id = create(spec);
    }

    Reply r = perform("POST", "/containers/" + url_encode(id) + "/start");
    if (r.status == 204 || r.status == 304) {
        std::cout << "[DOCKER] Started " << id.substr(0, 12) << " (" << spec.image
                  << ") " << spec.internal_port << "/tcp -> 127.0.0.1:" << spec.host_port << "\n";
        return id;
    }

    // Do not leave a created-but-never-started container behind.
    try {
        remove(id, true);
    } catch (const GatewayError& e) {
        std::cerr << "[DOCKER] Cleanup of " << id.substr(0, 12) << " failed: " << e.what() << "\n";
    }
    fail(r.status == 404 ? ErrorKind::ContainerNotFound : ErrorKind::OperationFailed, "start", r);
}

json DockerClient::inspect(const std::string& id) {
    Reply r = perform("GET", "/containers/" + url_encode(id) + "/json");
    if (r.status == 404) fail(ErrorKind::ContainerNotFound, "inspect", r);
    if (r.status != 200) fail(ErrorKind::OperationFailed, "inspect", r);
    return parse_or_fail(r.body, "inspect");
}

std::vector<std::string> DockerClient::list_ids(bool all, const std::string& label_filter) {
    json filters = {{"label", json::array({label_filter})}};
    std::string path = std::string("/containers/json?all=") + (all ? "1" : "0") +
                       "&filters=" + url_encode(filters.dump());

    Reply r = perform("GET", path);
    if (r.status != 200) fail(ErrorKind::OperationFailed, "list", r);

    json arr = parse_or_fail(r.body, "list");
    std::vector<std::string> ids;
    if (!arr.is_array()) return ids;
    for (const auto& c : arr) {
        if (c.contains("Id") && c["Id"].is_string()) ids.push_back(c["Id"].get<std::string>());
    }
    return ids;
}

void DockerClient::start(const std::string& id) {
    Reply r = perform("POST", "/containers/" + url_encode(id) + "/start");
    if (r.status == 204 || r.status == 304) return;
    fail(r.status == 404 ? ErrorKind::ContainerNotFound : ErrorKind::OperationFailed, "start", r);
}

void DockerClient::stop(const std::string& id, int timeout_seconds) {
    Reply r = perform("POST",
                      "/containers/" + url_encode(id) + "/stop?t=" + std::to_string(timeout_seconds),
                      "", timeout_seconds + 30L);
    if (r.status == 204 || r.status == 304) return;
    fail(r.status == 404 ? ErrorKind::ContainerNotFound : ErrorKind::OperationFailed, "stop", r);
}

void DockerClient::remove(const std::string& id, bool force) {
    Reply r = perform("DELETE",
                      "/containers/" + url_encode(id) + "?force=" + (force ? "true" : "false"));
    if (r.status == 204) return;
    fail(r.status == 404 ? ErrorKind::ContainerNotFound : ErrorKind::OperationFailed, "remove", r);
}

std::unique_ptr<ChunkSource> DockerClient::stream_logs(const std::string& id,
                                                       std::optional<int> tail,
                                                       bool follow) {
    // Inspect first: resolves names to ids, surfaces 404 before streaming,
    // and tells us whether the output is framed (no TTY) or raw.
    json info = inspect(id);
    bool tty = false;
    if (info.contains("Config") && info["Config"].is_object()) {
        const auto& cfg = info["Config"];
        tty = cfg.contains("Tty") && cfg["Tty"].is_boolean() && cfg["Tty"].get<bool>();
    }
    std::string full_id = info.value("Id", id);

    std::string target = "/" + api_ + "/containers/" + url_encode(full_id) +
                         "/logs?stdout=1&stderr=1&follow=" + (follow ? "1" : "0") +
                         "&tail=" + (tail ? std::to_string(*tail) : std::string("all"));

    return std::make_unique<DockerLogStream>(socket_path_, target, !tty);
}

// ---------------------------------------------------------------------------
// Exec: create → start (attached, output demultiplexed) → inspect exit code
// ---------------------------------------------------------------------------
ExecResult DockerClient::exec(const std::string& id, const ExecSpec& spec) {
    json exec_create = {
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty",          spec.tty},
        {"Cmd",          spec.command}
    };
    if (spec.workdir) exec_create["WorkingDir"] = *spec.workdir;
    if (!spec.env.empty()) {
        json env = json::array();
        for (const auto& [k, v] : spec.env) env.push_back(k + "=" + v);
        exec_create["Env"] = env;
    }

    Reply r = perform("POST", "/containers/" + url_encode(id) + "/exec", exec_create.dump());
    if (r.status == 404) fail(ErrorKind::ContainerNotFound, "exec", r);
    if (r.status != 201) fail(ErrorKind::OperationFailed, "exec", r);

    json created = parse_or_fail(r.body, "exec");
    if (!created.contains("Id") || !created["Id"].is_string()) {
        throw GatewayError(ErrorKind::OperationFailed, "exec: response carries no exec id");
    }
    const std::string exec_id = created["Id"].get<std::string>();

    json start = {{"Detach", false}, {"Tty", spec.tty}};
    r = perform("POST", "/exec/" + url_encode(exec_id) + "/start", start.dump(), 0L);
    if (r.status == 404) fail(ErrorKind::ContainerNotFound, "exec start", r);
    if (r.status != 200) fail(ErrorKind::OperationFailed, "exec start", r);

    ExecResult result;
    std::string err;
    LogFrameDecoder decoder(!spec.tty);
    decoder.feed(r.body.data(), r.body.size());
    while (auto frame = decoder.pop()) {
        if (frame->stream == LogFrameDecoder::STDERR) err += frame->payload;
        else result.stdout_text += frame->payload;
    }
    if (!err.empty()) result.stderr_text = err;

    r = perform("GET", "/exec/" + url_encode(exec_id) + "/json");
    if (r.status != 200) fail(ErrorKind::OperationFailed, "exec inspect", r);
    json state = parse_or_fail(r.body, "exec inspect");
    if (state.contains("ExitCode") && state["ExitCode"].is_number_integer()) {
        result.exit_code = state["ExitCode"].get<int>();
    }
    return result;
}

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

std::pair<std::string, std::string> DockerClient::split_reference(const std::string& reference) {
    if (reference.find('@') != std::string::npos) return {reference, ""};

    size_t slash = reference.rfind('/');
    size_t colon = reference.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {reference.substr(0, colon), reference.substr(colon + 1)};
    }
    return {reference, "latest"};
}

std::vector<ImageInfo> DockerClient::list_images() {
    Reply r = perform("GET", "/images/json");
    if (r.status != 200) fail(ErrorKind::OperationFailed, "images", r);

    json arr = parse_or_fail(r.body, "images");
    std::vector<ImageInfo> out;
    if (!arr.is_array()) return out;

    for (const auto& img : arr) {
        if (!img.is_object()) continue;
        ImageInfo info;
        std::string id = img.value("Id", std::string());
        if (id.rfind("sha256:", 0) == 0) id = id.substr(7);
        info.id = id.substr(0, 10);

        if (img.contains("RepoTags") && img["RepoTags"].is_array()) {
            for (const auto& t : img["RepoTags"]) {
                if (t.is_string()) info.repo_tags.push_back(t.get<std::string>());
            }
        }
        if (img.contains("Size") && img["Size"].is_number_integer()) {
            info.size = img["Size"].get<int64_t>();
        }
        out.push_back(std::move(info));
    }
    return out;
}

std::string DockerClient::pull_image(const std::string& reference) {
    auto [repo, tag] = split_reference(reference);
    std::string path = "/images/create?fromImage=" + url_encode(repo);
    if (!tag.empty()) path += "&tag=" + url_encode(tag);

    // Pulls can legitimately take minutes.
    Reply r = perform("POST", path, "", 0L);
    if (r.status == 404) fail(ErrorKind::ImageNotFound, "pull", r);
    if (r.status != 200) fail(ErrorKind::OperationFailed, "pull", r);

    // Progress arrives as one JSON object per line; a failed pull still
    // answers 200 and reports the error in-stream.
    std::istringstream lines(r.body);
    std::string line;
    while (std::getline(lines, line)) {
        json j = json::parse(line, nullptr, false);
        if (j.is_object() && j.contains("error")) {
            std::string msg = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
            std::cerr << "[DOCKER] pull " << reference << " failed: " << msg << "\n";
            throw GatewayError(ErrorKind::ImageNotFound, msg);
        }
    }

    std::string pulled = tag.empty() ? repo : repo + ":" + tag;
    Reply info = perform("GET", "/images/" + encode_image_path(pulled) + "/json");
    if (info.status == 404) fail(ErrorKind::ImageNotFound, "pull", info);
    if (info.status != 200) fail(ErrorKind::OperationFailed, "pull", info);

    json j = parse_or_fail(info.body, "pull");
    std::cout << "[DOCKER] Pulled " << pulled << "\n";
    return j.value("Id", std::string());
}
