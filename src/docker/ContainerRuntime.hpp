#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dockgate {

struct VolumeBind {
    std::string host_path;
    std::string container_path;
    std::string mode;   // "ro" | "rw"
};

// Everything create_and_start() needs. host_port is already resolved by the
// caller (allocated or user supplied); the adapter never picks ports.
struct CreateSpec {
    std::string image;
    uint16_t    internal_port{0};
    uint16_t    host_port{0};
    std::optional<std::string>         name;
    std::map<std::string, std::string> env;
    std::vector<std::string>           command;   // empty = image default
    std::map<std::string, std::string> labels;
    std::optional<std::string>         restart_policy;
    bool                               auto_remove{true};
    std::vector<VolumeBind>            volumes;
    std::optional<std::string>         network;
};

struct ImageInfo {
    std::string              id;
    std::vector<std::string> repo_tags;
    int64_t                  size{0};
};

struct ExecSpec {
    std::vector<std::string>           command;
    std::optional<std::string>         workdir;
    std::map<std::string, std::string> env;
    bool                               tty{false};
};

struct ExecResult {
    int                        exit_code{0};
    std::string                stdout_text;
    std::optional<std::string> stderr_text;
};

// ---------------------------------------------------------------------------
// Pull-style byte stream. next() may block on I/O; std::nullopt means the
// stream is exhausted. close() may be called from another thread and must
// unblock a pending next(). Not restartable.
// ---------------------------------------------------------------------------
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    virtual std::optional<std::string> next() = 0;
    virtual void close() = 0;
};

// ---------------------------------------------------------------------------
// Synchronous facade over the container runtime control channel.
// Implementations must be safe for concurrent use from worker threads.
//
// Failure contract (GatewayError kinds):
//   any call            → RuntimeUnavailable when the channel is unreachable
//   create_and_start    → ImageNotFound, NameConflict, InvalidRequest
//   inspect/start/stop/
//   remove/stream_logs/
//   exec                → ContainerNotFound, OperationFailed
// ---------------------------------------------------------------------------
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual void ping() = 0;

    virtual std::string    create_and_start(const CreateSpec& spec) = 0;
    virtual nlohmann::json inspect(const std::string& id) = 0;

    // Ids of containers carrying label_filter. all=false → running only.
    virtual std::vector<std::string> list_ids(bool all, const std::string& label_filter) = 0;

    virtual void start(const std::string& id) = 0;
    virtual void stop(const std::string& id, int timeout_seconds) = 0;
    virtual void remove(const std::string& id, bool force) = 0;

    virtual std::unique_ptr<ChunkSource> stream_logs(const std::string& id,
                                                     std::optional<int> tail,
                                                     bool follow) = 0;

    virtual ExecResult exec(const std::string& id, const ExecSpec& spec) = 0;

    virtual std::vector<ImageInfo> list_images() = 0;
    virtual std::string            pull_image(const std::string& reference) = 0;
};

} // namespace dockgate
