#pragma once

#include "docker/DockerClient.hpp"
#include "net/PortAllocator.hpp"
#include "proxy/ProxyDispatcher.hpp"
#include "readiness/ReadinessGate.hpp"
#include "runtime/GatewayConfig.hpp"
#include "server/GatewayServer.hpp"
#include "server/Router.hpp"
#include "service/ContainerService.hpp"

namespace dockgate {

// Single owner of every long-lived component. Constructed once in main();
// members are declared in dependency order so destruction runs server first,
// runtime client last.
struct Context {
    GatewayConfig config;

    DockerClient     docker;
    PortAllocator    ports;
    ReadinessGate    readiness;
    ContainerService service;
    ProxyDispatcher  proxy;
    Router           router;
    GatewayServer    server;

    explicit Context(const GatewayConfig& cfg)
        : config(cfg),
          docker(cfg.docker_socket, cfg.docker_api),
          readiness(cfg.ready_poll, cfg.ready_attempt),
          service(docker, ports, readiness, cfg.run_settle),
          proxy(docker, cfg.upstream_timeout),
          router(service, proxy),
          server(cfg.listen_addr, cfg.port, router, cfg.max_connections) {}

    Context(const Context&)            = delete;
    Context& operator=(const Context&) = delete;
};

} // namespace dockgate
