#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "docker/ContainerRuntime.hpp"

namespace dockgate {

// ---------------------------------------------------------------------------
// Body of POST /containers/run after validation. Every malformed field is
// rejected with GatewayError(InvalidRequest) naming the field.
// ---------------------------------------------------------------------------
struct RunRequest {
    std::string image;                 // ":latest" appended when untagged
    uint16_t    container_port{0};
    uint16_t    host_port{0};          // 0 = allocate

    std::optional<std::string>         name;
    std::map<std::string, std::string> env;
    std::vector<std::string>           command;

    bool                       auto_remove{true};
    std::optional<std::string> restart_policy{"unless-stopped"};

    std::vector<std::string>   volumes;
    std::optional<std::string> network;

    bool        wait_ready{false};
    std::string health_path{"/"};
    int         wait_timeout{30};      // seconds

    static RunRequest from_json(const nlohmann::json& body);
};

// POST /containers/{id}/exec body.
ExecSpec exec_spec_from_json(const nlohmann::json& body);

// "nginx" -> "nginx:latest". Any ':' counts as a tag.
std::string normalize_image(const std::string& image);

// Shell-style word splitting: whitespace separated, '...' literal, "..." with
// backslash escapes. An unterminated quote is InvalidRequest.
std::vector<std::string> split_command(const std::string& command);

} // namespace dockgate
