#include "service/RunRequest.hpp"
#include "core/GatewayError.hpp"
#include <cctype>

using namespace dockgate;
using json = nlohmann::json;

static constexpr const char* RESTART_POLICIES[] = {
    "no", "on-failure", "always", "unless-stopped"
};

[[noreturn]] static void invalid(const std::string& what) {
    throw GatewayError(ErrorKind::InvalidRequest, what);
}

// Absent and explicit null are treated the same.
static const json* field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return nullptr;
    return &*it;
}

static std::string string_field(const json& v, const char* key) {
    if (!v.is_string()) invalid(std::string(key) + " must be a string");
    return v.get<std::string>();
}

static bool bool_field(const json& v, const char* key) {
    if (!v.is_boolean()) invalid(std::string(key) + " must be a boolean");
    return v.get<bool>();
}

static uint16_t port_field(const json& v, const char* key, bool allow_zero) {
    if (!v.is_number_integer()) invalid(std::string(key) + " must be an integer");
    int64_t p = v.get<int64_t>();
    if (p == 0 && allow_zero) return 0;
    if (p < 1 || p > 65535) invalid(std::string(key) + " must be between 1 and 65535");
    return static_cast<uint16_t>(p);
}

static std::map<std::string, std::string> env_field(const json& v) {
    if (!v.is_object()) invalid("env must be an object of strings");
    std::map<std::string, std::string> env;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (!it.value().is_string()) invalid("env." + it.key() + " must be a string");
        env[it.key()] = it.value().get<std::string>();
    }
    return env;
}

static std::vector<std::string> command_field(const json& v) {
    if (v.is_string()) return split_command(v.get<std::string>());
    if (!v.is_array()) invalid("command must be a string or a list of strings");

    std::vector<std::string> argv;
    for (const auto& a : v) {
        if (!a.is_string()) invalid("command must be a string or a list of strings");
        argv.push_back(a.get<std::string>());
    }
    return argv;
}

std::string dockgate::normalize_image(const std::string& image) {
    if (image.find(':') == std::string::npos) return image + ":latest";
    return image;
}

std::vector<std::string> dockgate::split_command(const std::string& command) {
    std::vector<std::string> words;
    std::string cur;
    bool   in_word = false;
    size_t i = 0;

    while (i < command.size()) {
        char c = command[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(cur);
                cur.clear();
                in_word = false;
            }
            ++i;
        } else if (c == '\'') {
            size_t close = command.find('\'', i + 1);
            if (close == std::string::npos) invalid("command has an unterminated quote");
            cur.append(command, i + 1, close - i - 1);
            in_word = true;
            i = close + 1;
        } else if (c == '"') {
            ++i;
            bool closed = false;
            while (i < command.size()) {
                char d = command[i];
                if (d == '"') { closed = true; ++i; break; }
                if (d == '\\' && i + 1 < command.size() &&
                    (command[i + 1] == '"' || command[i + 1] == '\\' || command[i + 1] == '$' ||
                     command[i + 1] == '`')) {
                    cur += command[i + 1];
                    i += 2;
                    continue;
                }
                cur += d;
                ++i;
            }
            if (!closed) invalid("command has an unterminated quote");
            in_word = true;
        } else if (c == '\\' && i + 1 < command.size()) {
            cur += command[i + 1];
            in_word = true;
            i += 2;
        } else {
            cur += c;
            in_word = true;
            ++i;
        }
    }
    if (in_word) words.push_back(cur);
    return words;
}

RunRequest RunRequest::from_json(const json& body) {
    if (!body.is_object()) invalid("request body must be a JSON object");

    RunRequest r;

    const json* image = field(body, "image");
    if (!image) invalid("image is required");
    r.image = string_field(*image, "image");
    if (r.image.empty()) invalid("image must not be empty");
    r.image = normalize_image(r.image);

    const json* cport = field(body, "container_port");
    if (!cport) invalid("container_port is required");
    r.container_port = port_field(*cport, "container_port", false);

    if (const json* v = field(body, "host_port")) r.host_port = port_field(*v, "host_port", true);

    if (const json* v = field(body, "name")) {
        std::string name = string_field(*v, "name");
        if (!name.empty()) r.name = name;
    }
    if (const json* v = field(body, "env"))     r.env     = env_field(*v);
    if (const json* v = field(body, "command")) r.command = command_field(*v);

    if (const json* v = field(body, "auto_remove")) r.auto_remove = bool_field(*v, "auto_remove");
    if (const json* v = field(body, "detach"))      bool_field(*v, "detach");  // always detached

    // Explicit null disables the policy; absent keeps the default.
    auto rp = body.find("restart_policy");
    if (rp != body.end()) {
        if (rp->is_null()) {
            r.restart_policy.reset();
        } else {
            std::string policy = string_field(*rp, "restart_policy");
            bool known = false;
            for (const char* p : RESTART_POLICIES) known = known || policy == p;
            if (!known) invalid("restart_policy must be one of no, on-failure, always, unless-stopped");
            r.restart_policy = policy;
        }
    }

    if (const json* v = field(body, "volumes")) {
        if (!v->is_array()) invalid("volumes must be a list of strings");
        for (const auto& s : *v) {
            if (!s.is_string()) invalid("volumes must be a list of strings");
            r.volumes.push_back(s.get<std::string>());
        }
    }
    if (const json* v = field(body, "network")) {
        std::string net = string_field(*v, "network");
        if (!net.empty()) r.network = net;
    }

    if (const json* v = field(body, "wait_ready"))  r.wait_ready  = bool_field(*v, "wait_ready");
    if (const json* v = field(body, "health_path")) r.health_path = string_field(*v, "health_path");
    if (const json* v = field(body, "wait_timeout")) {
        if (!v->is_number_integer()) invalid("wait_timeout must be an integer");
        int64_t t = v->get<int64_t>();
        if (t <= 0 || t > 3600) invalid("wait_timeout must be between 1 and 3600 seconds");
        r.wait_timeout = static_cast<int>(t);
    }
    return r;
}

ExecSpec dockgate::exec_spec_from_json(const json& body) {
    if (!body.is_object()) invalid("request body must be a JSON object");

    ExecSpec spec;
    const json* cmd = field(body, "command");
    if (!cmd) invalid("command is required");
    spec.command = command_field(*cmd);
    if (spec.command.empty()) invalid("command must not be empty");

    if (const json* v = field(body, "workdir")) spec.workdir = string_field(*v, "workdir");
    if (const json* v = field(body, "env"))     spec.env     = env_field(*v);
    if (const json* v = field(body, "tty"))     spec.tty     = bool_field(*v, "tty");
    return spec;
}
