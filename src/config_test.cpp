// =============================================================================
// src/config_test.cpp - Defaults, overrides and the .env loader
// =============================================================================

#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

#include "runtime/GatewayConfig.hpp"
#include "testing/TestHarness.hpp"

using namespace dockgate;
using dockgate::testing::TestHarness;

static void test_defaults(TestHarness& t) {
    t.section("Defaults");
    GatewayConfig cfg;
    t.equal(cfg.listen_addr, std::string("0.0.0.0"), "listen address");
    t.equal(cfg.port, uint16_t(8080), "port");
    t.equal(cfg.docker_socket, std::string("/var/run/docker.sock"), "docker socket");
    t.equal(cfg.docker_api, std::string("v1.41"), "engine API version");
    t.equal(cfg.max_connections, 64, "connection cap");
    t.equal(cfg.upstream_timeout.count(), 60L, "upstream timeout");
}

static void test_apply(TestHarness& t) {
    t.section("apply()");
    GatewayConfig cfg;

    t.check(cfg.apply("DOCKGATE_PORT", "9090") && cfg.port == 9090, "port override");
    t.check(cfg.apply("DOCKGATE_PORT", "70000") && cfg.port == 9090, "out-of-range port ignored");
    t.check(cfg.apply("DOCKGATE_PORT", "80x") && cfg.port == 9090, "trailing junk ignored");
    t.check(cfg.apply("DOCKGATE_DOCKER_API", "1.43") && cfg.docker_api == "v1.43", "API version gets v prefix");
    t.check(cfg.apply("DOCKGATE_DOCKER_API", "v1.44") && cfg.docker_api == "v1.44", "v prefix kept");
    t.check(cfg.apply("DOCKGATE_MAX_CONNECTIONS", "0") && cfg.max_connections == 64, "zero connections ignored");
    t.check(cfg.apply("DOCKGATE_MAX_CONNECTIONS", "8") && cfg.max_connections == 8, "connection cap");
    t.check(cfg.apply("DOCKGATE_READY_POLL_MS", "250") && cfg.ready_poll.count() == 250, "poll interval");
    t.check(cfg.apply("DOCKGATE_LISTEN_ADDR", "") && cfg.listen_addr == "0.0.0.0", "empty address ignored");
    t.check(cfg.apply("DOCKGATE_RUN_SETTLE_MS", "0") && cfg.run_settle.count() == 0, "zero settle delay accepted");
    t.check(cfg.apply("DOCKGATE_RUN_SETTLE_MS", "-5") && cfg.run_settle.count() == 0, "negative settle ignored");
    t.check(cfg.apply("DOCKGATE_READY_POLL_MS", "0") && cfg.ready_poll.count() == 250, "zero poll interval ignored");
    t.check(!cfg.apply("DOCKGATE_NOPE", "1"), "unknown key rejected");
}

static void test_args(TestHarness& t) {
    t.section("apply_args()");
    GatewayConfig cfg;
    const char* argv[] = {"dockgate", "--listen-addr=127.0.0.1", "--port=18080",
                          "--docker-socket=/tmp/d.sock", "--bogus=1", "stray", "--port"};
    cfg.apply_args(7, const_cast<char**>(argv));
    t.equal(cfg.listen_addr, std::string("127.0.0.1"), "--listen-addr");
    t.equal(cfg.port, uint16_t(18080), "--port");
    t.equal(cfg.docker_socket, std::string("/tmp/d.sock"), "--docker-socket");
}

static void test_dotenv(TestHarness& t) {
    t.section(".env loading");
    const std::string path = "/tmp/dockgate-test-" + std::to_string(::getpid()) + ".env";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "DOCKGATE_PORT=7070\n"
          << "export DOCKGATE_DOCKER_SOCKET=\"/run/user/docker.sock\"\n"
          << "DOCKGATE_LISTEN_ADDR = '127.0.0.2'\r\n"
          << "not a pair\n";
    }
    ::unsetenv("DOCKGATE_DOCKER_SOCKET");
    ::unsetenv("DOCKGATE_LISTEN_ADDR");
    ::setenv("DOCKGATE_PORT", "6060", 1);

    load_dotenv(path.c_str());
    GatewayConfig cfg = GatewayConfig::from_env();

    t.equal(cfg.port, uint16_t(6060), "environment wins over the file");
    t.equal(cfg.docker_socket, std::string("/run/user/docker.sock"), "export prefix and quotes stripped");
    t.equal(cfg.listen_addr, std::string("127.0.0.2"), "spaces, single quotes and CRLF handled");

    load_dotenv("/tmp/dockgate-definitely-missing.env");
    t.pass("missing file is a no-op");

    ::unlink(path.c_str());
    ::unsetenv("DOCKGATE_PORT");
    ::unsetenv("DOCKGATE_DOCKER_SOCKET");
    ::unsetenv("DOCKGATE_LISTEN_ADDR");
}

int main() {
    TestHarness t("DOCKGATE - CONFIG");

    test_defaults(t);
    test_apply(t);
    test_args(t);
    test_dotenv(t);

    return t.summary();
}
