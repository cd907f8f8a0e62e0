#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace dockgate {

// ---------------------------------------------------------------------------
// Process configuration. Precedence, lowest first:
//   built-in defaults < .env file < process environment < --flags
// load_dotenv() never overrides a variable that is already set, so the
// environment wins over the file. from_env() then reads DOCKGATE_* keys and
// apply_args() maps --listen-addr=X onto DOCKGATE_LISTEN_ADDR and so on.
// ---------------------------------------------------------------------------
struct GatewayConfig {
    std::string listen_addr{"0.0.0.0"};
    uint16_t    port{8080};

    std::string docker_socket{"/var/run/docker.sock"};
    std::string docker_api{"v1.41"};

    int max_connections{64};

    std::chrono::seconds      upstream_timeout{60};
    std::chrono::milliseconds ready_poll{500};
    std::chrono::milliseconds ready_attempt{2000};
    std::chrono::milliseconds run_settle{300};

    static GatewayConfig from_env();

    // Returns false for an unknown key. A malformed value keeps the current
    // setting and logs a warning.
    bool apply(const std::string& key, const std::string& value);
    void apply_args(int argc, char** argv);

    void print() const;
};

// KEY=VALUE loader. Missing file is a silent no-op.
void load_dotenv(const char* path);

} // namespace dockgate
