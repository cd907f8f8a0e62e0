#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docker/ContainerRuntime.hpp"
#include "registry/ContainerView.hpp"
#include "service/RunRequest.hpp"

namespace dockgate {

class PortAllocator;
class ReadinessGate;

// ---------------------------------------------------------------------------
// Container lifecycle on top of the runtime adapter.
//
// run():
//   1. host port = request.host_port, or a fresh loopback reservation
//   2. labels managed/container_port(/name), volumes parsed
//   3. create_and_start, then a short settle delay so the runtime has
//      published the port binding
//   4. wait_ready → readiness gate on the live binding. A timeout fails the
//      call with ReadinessTimeout but leaves the container running.
//   5. descriptor from a fresh inspection
//
// Stateless: every call goes back to the runtime. Safe to call from any
// number of threads as long as the runtime is.
// ---------------------------------------------------------------------------
class ContainerService {
public:
    static constexpr int DEFAULT_STOP_TIMEOUT = 10;

    ContainerService(ContainerRuntime& runtime,
                     PortAllocator& ports,
                     const ReadinessGate& gate,
                     std::chrono::milliseconds settle = std::chrono::milliseconds(300));

    void ping();

    ContainerDescriptor              run(const RunRequest& req);
    ContainerDescriptor              get(const std::string& id);
    std::vector<ContainerDescriptor> list();   // managed only, every state

    void start(const std::string& id);
    void stop(const std::string& id, int timeout_seconds = DEFAULT_STOP_TIMEOUT);
    void remove(const std::string& id, bool force);

    std::unique_ptr<ChunkSource> logs(const std::string& id, std::optional<int> tail, bool follow);
    ExecResult                   exec(const std::string& id, const ExecSpec& spec);

    std::vector<ImageInfo> list_images();
    std::string            pull_image(const std::string& reference);

    // Labels, volumes and policy for a validated request.
    static CreateSpec build_spec(const RunRequest& req, uint16_t host_port);

private:
    ContainerRuntime&         runtime_;
    PortAllocator&            ports_;
    const ReadinessGate&      gate_;
    std::chrono::milliseconds settle_;
};

} // namespace dockgate
