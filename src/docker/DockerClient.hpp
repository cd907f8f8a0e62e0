#pragma once
#include <string>
#include <utility>
#include <curl/curl.h>

#include "core/GatewayError.hpp"
#include "docker/ContainerRuntime.hpp"

namespace dockgate {

// ---------------------------------------------------------------------------
// Docker Engine REST API over the daemon's unix socket (libcurl with
// CURLOPT_UNIX_SOCKET_PATH). Every call builds its own easy handle: one
// DockerClient is shared by all worker threads and CURL handles are not
// thread-safe.
//
// Status mapping follows the Engine API: 404 → ContainerNotFound (or
// ImageNotFound on create/pull), 409 on create → NameConflict, 400 on create →
// InvalidRequest, other failures → OperationFailed. A transport error means
// the daemon is unreachable → RuntimeUnavailable.
// ---------------------------------------------------------------------------
class DockerClient final : public ContainerRuntime {
public:
    DockerClient(std::string socket_path, std::string api_version);

    DockerClient(const DockerClient&) = delete;
    DockerClient& operator=(const DockerClient&) = delete;

    void ping() override;

    std::string    create_and_start(const CreateSpec& spec) override;
    nlohmann::json inspect(const std::string& id) override;
    std::vector<std::string> list_ids(bool all, const std::string& label_filter) override;

    void start(const std::string& id) override;
    void stop(const std::string& id, int timeout_seconds) override;
    void remove(const std::string& id, bool force) override;

    std::unique_ptr<ChunkSource> stream_logs(const std::string& id,
                                             std::optional<int> tail,
                                             bool follow) override;

    ExecResult exec(const std::string& id, const ExecSpec& spec) override;

    std::vector<ImageInfo> list_images() override;
    std::string            pull_image(const std::string& reference) override;

    // "nginx" → {nginx, latest}; "reg:5000/app:1.2" → {reg:5000/app, 1.2}.
    // Digest references keep the whole reference and an empty tag.
    static std::pair<std::string, std::string> split_reference(const std::string& reference);

    // JSON body for POST /containers/create.
    static nlohmann::json create_body(const CreateSpec& spec);

private:
    struct Reply {
        long        status{0};
        std::string body;
    };

    Reply perform(const std::string& method,
                  const std::string& path,
                  const std::string& body = "",
                  long timeout_secs = 30) const;

    std::string create(const CreateSpec& spec);

    [[noreturn]] static void fail(ErrorKind kind, const std::string& op, const Reply& r);
    static std::string message_of(const Reply& r);
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string socket_path_;
    std::string api_;
};

} // namespace dockgate
