#include "service/ContainerService.hpp"
#include "core/GatewayError.hpp"
#include "net/PortAllocator.hpp"
#include "readiness/ReadinessGate.hpp"
#include "registry/VolumeSpec.hpp"
#include <iostream>
#include <thread>

using namespace dockgate;

ContainerService::ContainerService(ContainerRuntime& runtime,
                                   PortAllocator& ports,
                                   const ReadinessGate& gate,
                                   std::chrono::milliseconds settle)
    : runtime_(runtime), ports_(ports), gate_(gate), settle_(settle) {}

void ContainerService::ping() {
    runtime_.ping();
}

CreateSpec ContainerService::build_spec(const RunRequest& req, uint16_t host_port) {
    CreateSpec spec;
    spec.image          = req.image;
    spec.internal_port  = req.container_port;
    spec.host_port      = host_port;
    spec.name           = req.name;
    spec.env            = req.env;
    spec.command        = req.command;
    spec.auto_remove    = req.auto_remove;
    spec.restart_policy = req.restart_policy;
    spec.network        = req.network;
    spec.volumes        = parse_volumes(req.volumes);

    spec.labels[MANAGED_LABEL] = "true";
    spec.labels[PORT_LABEL]    = std::to_string(req.container_port);
    if (req.name) spec.labels[NAME_LABEL] = *req.name;
    return spec;
}

ContainerDescriptor ContainerService::run(const RunRequest& req) {
    const uint16_t host_port = req.host_port != 0 ? req.host_port : ports_.reserve();
    CreateSpec spec = build_spec(req, host_port);

    std::cout << "[GATEWAY] Run " << spec.image << " " << req.container_port
              << "/tcp -> 127.0.0.1:" << host_port
              << (req.name ? " as " + *req.name : std::string()) << "\n";

    const std::string id = runtime_.create_and_start(spec);

    if (settle_.count() > 0) std::this_thread::sleep_for(settle_);

    if (req.wait_ready) {
        // Probe whatever the runtime actually bound, not what was asked for.
        ContainerDescriptor d = describe(runtime_.inspect(id));
        gate_.await_ready(d.host_port.value_or(host_port), req.health_path,
                          std::chrono::seconds(req.wait_timeout));
    }

    ContainerDescriptor d = describe(runtime_.inspect(id));
    std::cout << "[GATEWAY] Started " << id.substr(0, 12) << " status=" << d.status << "\n";
    return d;
}

ContainerDescriptor ContainerService::get(const std::string& id) {
    return describe(runtime_.inspect(id));
}

std::vector<ContainerDescriptor> ContainerService::list() {
    std::vector<ContainerDescriptor> out;
    for (const auto& id : runtime_.list_ids(true, MANAGED_LABEL)) {
        try {
            out.push_back(describe(runtime_.inspect(id)));
        } catch (const GatewayError& e) {
            // auto_remove containers can vanish between list and inspect
            if (e.kind() != ErrorKind::ContainerNotFound) throw;
        }
    }
    return out;
}

void ContainerService::start(const std::string& id) {
    runtime_.start(id);
    std::cout << "[GATEWAY] Start " << id << "\n";
}

void ContainerService::stop(const std::string& id, int timeout_seconds) {
    runtime_.stop(id, timeout_seconds);
    std::cout << "[GATEWAY] Stop " << id << " (timeout " << timeout_seconds << "s)\n";
}

void ContainerService::remove(const std::string& id, bool force) {
    runtime_.remove(id, force);
    std::cout << "[GATEWAY] Remove " << id << (force ? " (forced)" : "") << "\n";
}

std::unique_ptr<ChunkSource> ContainerService::logs(const std::string& id,
                                                    std::optional<int> tail,
                                                    bool follow) {
    if (tail && *tail < 0) throw GatewayError(ErrorKind::InvalidRequest, "tail must not be negative");
    return runtime_.stream_logs(id, tail, follow);
}

ExecResult ContainerService::exec(const std::string& id, const ExecSpec& spec) {
    if (spec.command.empty()) throw GatewayError(ErrorKind::InvalidRequest, "command must not be empty");
    return runtime_.exec(id, spec);
}

std::vector<ImageInfo> ContainerService::list_images() {
    return runtime_.list_images();
}

std::string ContainerService::pull_image(const std::string& reference) {
    if (reference.empty()) throw GatewayError(ErrorKind::InvalidRequest, "image is required");
    std::cout << "[GATEWAY] Pull " << reference << "\n";
    return runtime_.pull_image(reference);
}
