#pragma once
// =============================================================================
// In-memory ContainerRuntime. Keeps Engine-API-shaped inspection records so
// the registry view, the service and the router run against the same JSON
// they would see from a real daemon.
// =============================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <nlohmann/json.hpp>

#include "core/GatewayError.hpp"
#include "docker/ContainerRuntime.hpp"

namespace dockgate::testing {

// Scripted chunk source. With hold_open the source blocks after the last
// chunk until close(), like a followed log stream of an idle container.
class ScriptedChunkSource final : public ChunkSource {
public:
    struct Probe {
        std::atomic<int>  pulls{0};
        std::atomic<bool> closed{false};
    };

    ScriptedChunkSource(std::deque<std::string> chunks, bool hold_open,
                        std::shared_ptr<Probe> probe = std::make_shared<Probe>())
        : chunks_(std::move(chunks)), hold_open_(hold_open), probe_(std::move(probe)) {}

    std::optional<std::string> next() override {
        probe_->pulls++;
        std::unique_lock<std::mutex> lk(mtx_);
        if (!chunks_.empty() && !probe_->closed.load()) {
            std::string c = std::move(chunks_.front());
            chunks_.pop_front();
            if (c == FAIL_MARKER) throw GatewayError(ErrorKind::OperationFailed, "log stream broke");
            return c;
        }
        if (hold_open_) cv_.wait(lk, [this]() { return probe_->closed.load(); });
        return std::nullopt;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            probe_->closed.store(true);
        }
        cv_.notify_all();
    }

    std::shared_ptr<Probe> probe() const { return probe_; }

    // A chunk with this content makes next() throw instead.
    static constexpr const char* FAIL_MARKER = "\x01<fail>";

private:
    std::mutex              mtx_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool                    hold_open_;
    std::shared_ptr<Probe>  probe_;
};

class FakeRuntime final : public ContainerRuntime {
public:
    // -------------------------------------------------------------------------
    // Test controls
    // -------------------------------------------------------------------------
    std::atomic<bool> reachable{true};
    std::set<std::string> missing_images;        // create → ImageNotFound
    std::deque<std::string> log_chunks{"line 1\n", "line 2\n"};
    bool follow_holds_open{true};
    ExecResult exec_result{0, "ok\n", std::nullopt};

    std::shared_ptr<ScriptedChunkSource::Probe> last_log_probe;
    std::optional<int> last_log_tail;
    bool               last_log_follow{false};
    CreateSpec         last_spec;
    ExecSpec           last_exec;
    int                create_calls{0};

    // Inspection record exactly as the daemon would return it.
    static nlohmann::json record(const std::string& id,
                                 const std::string& image,
                                 const std::map<std::string, std::string>& labels,
                                 const std::string& status,
                                 const nlohmann::json& ports,
                                 const std::string& name = "") {
        return nlohmann::json{
            {"Id", id},
            {"Name", name.empty() ? "/" + id.substr(0, 8) : "/" + name},
            {"State", {{"Status", status}, {"Running", status == "running"}}},
            {"Config", {{"Image", image}, {"Labels", labels}, {"Tty", false}}},
            {"NetworkSettings", {{"Ports", ports}}}
        };
    }

    static nlohmann::json binding(uint16_t container_port, uint16_t host_port) {
        return nlohmann::json{
            {std::to_string(container_port) + "/tcp",
             nlohmann::json::array({{{"HostIp", "127.0.0.1"}, {"HostPort", std::to_string(host_port)}}})}
        };
    }

    void add(const nlohmann::json& raw) {
        std::lock_guard<std::mutex> lk(mtx_);
        containers_[raw["Id"].get<std::string>()] = raw;
    }

    bool exists(const std::string& id) {
        std::lock_guard<std::mutex> lk(mtx_);
        return containers_.count(id) > 0;
    }

    // -------------------------------------------------------------------------
    // ContainerRuntime
    // -------------------------------------------------------------------------
    void ping() override { check_reachable(); }

    std::string create_and_start(const CreateSpec& spec) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        create_calls++;
        last_spec = spec;
        if (missing_images.count(spec.image)) {
            throw GatewayError(ErrorKind::ImageNotFound, "No such image: " + spec.image);
        }
        if (spec.name) {
            for (const auto& c : containers_) {
                if (c.second["Name"] == "/" + *spec.name) {
                    throw GatewayError(ErrorKind::NameConflict, "name already in use: " + *spec.name);
                }
            }
        }

        std::string id = make_id(++seq_);
        nlohmann::json raw = record(id, spec.image, spec.labels, "running",
                                    binding(spec.internal_port, spec.host_port),
                                    spec.name.value_or(""));
        raw["HostConfig"] = {{"AutoRemove", spec.auto_remove}};
        containers_[id] = raw;
        return id;
    }

    nlohmann::json inspect(const std::string& id) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        return find(id);
    }

    std::vector<std::string> list_ids(bool all, const std::string& label_filter) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<std::string> ids;
        for (const auto& c : containers_) {
            const auto& labels = c.second["Config"]["Labels"];
            if (!label_filter.empty() && !labels.contains(label_filter)) continue;
            if (!all && c.second["State"]["Status"] != "running") continue;
            ids.push_back(c.first);
        }
        return ids;
    }

    void start(const std::string& id) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        nlohmann::json& raw = find(id);
        raw["State"]["Status"] = "running";
    }

    void stop(const std::string& id, int timeout_seconds) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        nlohmann::json& raw = find(id);
        last_stop_timeout = timeout_seconds;
        if (raw.value("HostConfig", nlohmann::json::object()).value("AutoRemove", false)) {
            containers_.erase(id);
            return;
        }
        raw["State"]["Status"] = "exited";
        raw["NetworkSettings"]["Ports"] = nlohmann::json::object();
    }

    void remove(const std::string& id, bool force) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        nlohmann::json& raw = find(id);
        if (raw["State"]["Status"] == "running" && !force) {
            throw GatewayError(ErrorKind::OperationFailed,
                               "cannot remove a running container, stop it or use force");
        }
        containers_.erase(id);
    }

    std::unique_ptr<ChunkSource> stream_logs(const std::string& id,
                                             std::optional<int> tail,
                                             bool follow) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        find(id);
        last_log_tail   = tail;
        last_log_follow = follow;
        auto src = std::make_unique<ScriptedChunkSource>(log_chunks, follow && follow_holds_open);
        last_log_probe = src->probe();
        return src;
    }

    ExecResult exec(const std::string& id, const ExecSpec& spec) override {
        check_reachable();
        std::lock_guard<std::mutex> lk(mtx_);
        find(id);
        last_exec = spec;
        return exec_result;
    }

    std::vector<ImageInfo> list_images() override {
        check_reachable();
        return {ImageInfo{"0123456789", {"nginx:latest"}, 187000000}};
    }

    std::string pull_image(const std::string& reference) override {
        check_reachable();
        if (missing_images.count(reference)) {
            throw GatewayError(ErrorKind::ImageNotFound, "pull access denied for " + reference);
        }
        return "sha256:feedface";
    }

    int last_stop_timeout{0};

private:
    void check_reachable() const {
        if (!reachable.load()) {
            throw GatewayError(ErrorKind::RuntimeUnavailable, "Cannot connect to the Docker daemon");
        }
    }

    nlohmann::json& find(const std::string& id) {
        auto it = containers_.find(id);
        if (it != containers_.end()) return it->second;
        // Short id or name, like the daemon resolves them.
        for (auto& c : containers_) {
            if (c.first.rfind(id, 0) == 0 || c.second["Name"] == "/" + id) return c.second;
        }
        throw GatewayError(ErrorKind::ContainerNotFound, "No such container: " + id);
    }

    static std::string make_id(int n) {
        std::string hex = "0123456789abcdef";
        std::string id;
        for (int i = 0; i < 64; ++i) id += hex[(n * 7 + i * 13) % 16];
        return id;
    }

    std::mutex                            mtx_;
    std::map<std::string, nlohmann::json> containers_;
    int                                   seq_{0};
};

} // namespace dockgate::testing
