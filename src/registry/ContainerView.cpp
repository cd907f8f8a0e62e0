#include "registry/ContainerView.hpp"
#include <cctype>

using namespace dockgate;
using json = nlohmann::json;

// Field accessors that never throw on missing or mistyped data.
static const json* child(const json& j, const char* key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

static std::string string_at(const json& j, const char* key) {
    const json* v = child(j, key);
    return (v && v->is_string()) ? v->get<std::string>() : std::string();
}

std::optional<uint16_t> dockgate::parse_port(const std::string& text) {
    size_t b = 0, e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    if (b == e || e - b > 5) return std::nullopt;

    unsigned long v = 0;
    for (size_t i = b; i < e; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
        v = v * 10 + static_cast<unsigned long>(text[i] - '0');
    }
    if (v == 0 || v > 65535) return std::nullopt;
    return static_cast<uint16_t>(v);
}

static std::optional<uint16_t> bound_port(const json& raw, uint16_t container_port) {
    const json* net = child(raw, "NetworkSettings");
    const json* ports = net ? child(*net, "Ports") : nullptr;
    if (!ports) return std::nullopt;

    const json* bindings = child(*ports, (std::to_string(container_port) + "/tcp").c_str());
    if (!bindings || !bindings->is_array() || bindings->empty()) return std::nullopt;

    const json& first = bindings->front();
    const json* host_port = child(first, "HostPort");
    if (!host_port) return std::nullopt;
    if (host_port->is_string()) return parse_port(host_port->get<std::string>());
    if (host_port->is_number_integer()) {
        auto v = host_port->get<int64_t>();
        if (v > 0 && v <= 65535) return static_cast<uint16_t>(v);
    }
    return std::nullopt;
}

ContainerDescriptor dockgate::describe(const json& raw) {
    ContainerDescriptor d;
    d.id = string_at(raw, "Id");

    std::string name = string_at(raw, "Name");
    if (!name.empty() && name[0] == '/') name.erase(0, 1);
    if (!name.empty()) d.name = name;

    if (const json* state = child(raw, "State")) d.status = string_at(*state, "Status");

    if (const json* config = child(raw, "Config")) {
        d.image = string_at(*config, "Image");
        if (const json* labels = child(*config, "Labels"); labels && labels->is_object()) {
            for (auto it = labels->begin(); it != labels->end(); ++it) {
                if (it.value().is_string()) d.labels[it.key()] = it.value().get<std::string>();
            }
        }
    }

    d.managed = d.labels.count(MANAGED_LABEL) > 0;

    auto port_label = d.labels.find(PORT_LABEL);
    if (port_label != d.labels.end()) {
        d.container_port = parse_port(port_label->second);
        if (d.container_port) d.host_port = bound_port(raw, *d.container_port);
    }
    return d;
}

json dockgate::to_json(const ContainerDescriptor& d) {
    json j = {
        {"id",     d.id},
        {"name",   d.name ? json(*d.name) : json(nullptr)},
        {"image",  d.image},
        {"status", d.status},
        {"labels", d.labels},
        {"host_port",      d.host_port ? json(*d.host_port) : json(nullptr)},
        {"container_port", d.container_port ? json(*d.container_port) : json(nullptr)}
    };
    return j;
}
