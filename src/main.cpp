#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <curl/curl.h>

#include "core/GatewayError.hpp"
#include "runtime/Context.hpp"

using namespace dockgate;

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    load_dotenv(".env");
    load_dotenv("../.env");

    GatewayConfig cfg = GatewayConfig::from_env();
    cfg.apply_args(argc, argv);
    cfg.print();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[GATEWAY] curl_global_init failed\n";
        return 1;
    }

    int rc = 0;
    {
        Context ctx(cfg);

        try {
            ctx.service.ping();
            std::cout << "[DOCKER] Daemon reachable at " << cfg.docker_socket << "\n";
        } catch (const GatewayError& e) {
            // Not fatal: /healthz reports it and every call retries the socket.
            std::cerr << "[DOCKER] " << e.what() << "\n";
        }

        try {
            ctx.server.start();
        } catch (const std::exception& e) {
            std::cerr << "[GATEWAY] " << e.what() << "\n";
            rc = 1;
        }

        if (rc == 0) {
            while (g_running.load() && ctx.server.running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            std::cout << "[GATEWAY] Shutting down\n";
            ctx.server.stop();
        }
    }

    curl_global_cleanup();
    return rc;
}
