#include "runtime/GatewayConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace dockgate;

static constexpr const char* KEYS[] = {
    "DOCKGATE_LISTEN_ADDR",
    "DOCKGATE_PORT",
    "DOCKGATE_DOCKER_SOCKET",
    "DOCKGATE_DOCKER_API",
    "DOCKGATE_MAX_CONNECTIONS",
    "DOCKGATE_UPSTREAM_TIMEOUT",
    "DOCKGATE_READY_POLL_MS",
    "DOCKGATE_READY_ATTEMPT_MS",
    "DOCKGATE_RUN_SETTLE_MS",
};

// Whole-string integer in [min, max], or false.
static bool parse_number(const std::string& s, long min, long max, long& out) {
    if (s.empty()) return false;
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size() || v < min || v > max) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

GatewayConfig GatewayConfig::from_env() {
    GatewayConfig cfg;
    for (const char* key : KEYS) {
        const char* v = std::getenv(key);
        if (v) cfg.apply(key, v);
    }
    return cfg;
}

bool GatewayConfig::apply(const std::string& key, const std::string& value) {
    long n = 0;
    auto bad = [&]() {
        std::cerr << "[CONFIG] Ignoring invalid " << key << "=" << value << "\n";
        return true;
    };

    if (key == "DOCKGATE_LISTEN_ADDR") {
        if (value.empty()) return bad();
        listen_addr = value;
    } else if (key == "DOCKGATE_PORT") {
        if (!parse_number(value, 1, 65535, n)) return bad();
        port = static_cast<uint16_t>(n);
    } else if (key == "DOCKGATE_DOCKER_SOCKET") {
        if (value.empty()) return bad();
        docker_socket = value;
    } else if (key == "DOCKGATE_DOCKER_API") {
        if (value.empty()) return bad();
        docker_api = value[0] == 'v' ? value : "v" + value;
    } else if (key == "DOCKGATE_MAX_CONNECTIONS") {
        if (!parse_number(value, 1, 4096, n)) return bad();
        max_connections = static_cast<int>(n);
    } else if (key == "DOCKGATE_UPSTREAM_TIMEOUT") {
        if (!parse_number(value, 1, 3600, n)) return bad();
        upstream_timeout = std::chrono::seconds(n);
    } else if (key == "DOCKGATE_READY_POLL_MS") {
        if (!parse_number(value, 1, 60'000, n)) return bad();
        ready_poll = std::chrono::milliseconds(n);
    } else if (key == "DOCKGATE_READY_ATTEMPT_MS") {
        if (!parse_number(value, 1, 600'000, n)) return bad();
        ready_attempt = std::chrono::milliseconds(n);
    } else if (key == "DOCKGATE_RUN_SETTLE_MS") {
        if (!parse_number(value, 0, 60'000, n)) return bad();   // 0 = no settle delay
        run_settle = std::chrono::milliseconds(n);
    } else {
        return false;
    }
    return true;
}

// --docker-socket=/tmp/d.sock  ->  DOCKGATE_DOCKER_SOCKET
void GatewayConfig::apply_args(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            std::cerr << "[CONFIG] Unrecognised argument: " << arg << "\n";
            continue;
        }
        size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[CONFIG] Expected --key=value, got " << arg << "\n";
            continue;
        }
        std::string name  = arg.substr(2, eq - 2);
        std::string value = arg.substr(eq + 1);

        std::string key = "DOCKGATE_";
        for (char c : name) {
            key += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (!apply(key, value)) {
            std::cerr << "[CONFIG] Unknown option --" << name << "\n";
        }
    }
}

void GatewayConfig::print() const {
    std::cout << "[CONFIG] listen=" << listen_addr << ":" << port
              << " docker=" << docker_socket << " api=" << docker_api
              << " max_connections=" << max_connections << "\n"
              << "[CONFIG] upstream_timeout=" << upstream_timeout.count() << "s"
              << " ready_poll=" << ready_poll.count() << "ms"
              << " ready_attempt=" << ready_attempt.count() << "ms"
              << " run_settle=" << run_settle.count() << "ms\n";
}

// ---------------------------------------------------------------------------
// .env loader: KEY=VALUE per line, # comments, optional "export " prefix,
// surrounding quotes stripped. Variables already in the environment win.
// ---------------------------------------------------------------------------
void dockgate::load_dotenv(const char* path) {
    std::ifstream f(path);
    if (!f.is_open()) return;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.rfind("export ", 0) == 0) key = key.substr(7);
        while (!key.empty() && key.back() == ' ') key.pop_back();

        size_t vs = 0;
        while (vs < value.size() && value[vs] == ' ') vs++;
        if (vs > 0) value = value.substr(vs);

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && !std::getenv(key.c_str())) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
}
