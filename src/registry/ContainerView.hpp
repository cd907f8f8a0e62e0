#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dockgate {

// Labels written on every container this gateway creates. The runtime's
// label store is the only place the gateway keeps state.
static constexpr const char* MANAGED_LABEL = "dockgate.managed";
static constexpr const char* PORT_LABEL    = "dockgate.container_port";
static constexpr const char* NAME_LABEL    = "dockgate.name";

struct ContainerDescriptor {
    std::string                        id;
    std::optional<std::string>         name;
    std::string                        image;
    std::string                        status;   // created|running|paused|restarting|removing|exited|dead
    std::map<std::string, std::string> labels;
    std::optional<uint16_t>            container_port;   // declared service port
    std::optional<uint16_t>            host_port;        // live loopback binding
    bool                               managed{false};
};

// ---------------------------------------------------------------------------
// Pure function: raw inspection record → descriptor. Same input, same output.
//
// host_port is only ever a live read. It is looked up under
// NetworkSettings.Ports["<container_port>/tcp"][0].HostPort and is absent
// whenever the service-port label is missing or malformed, the container is
// not running, or the binding cannot be parsed. None of those are errors.
// ---------------------------------------------------------------------------
ContainerDescriptor describe(const nlohmann::json& raw);

// Decimal TCP port in 1..65535, surrounding whitespace allowed.
std::optional<uint16_t> parse_port(const std::string& text);

nlohmann::json to_json(const ContainerDescriptor& d);

} // namespace dockgate
