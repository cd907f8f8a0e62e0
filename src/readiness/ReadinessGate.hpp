#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace dockgate {

// ---------------------------------------------------------------------------
// Readiness gate. Blocks until GET http://127.0.0.1:<port>/<path> answers
// 2xx or the wall-clock deadline passes.
//
// Each attempt has its own short timeout (clamped to the remaining budget),
// connection refused / timeout / non-2xx all mean "not yet", and attempts are
// spaced by the poll interval. The loop is bounded by the deadline, not by an
// attempt count: a slow network simply gets fewer attempts.
//
// Throws GatewayError(ReadinessTimeout) once the deadline has elapsed.
// ---------------------------------------------------------------------------
class ReadinessGate {
public:
    explicit ReadinessGate(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500),
                           std::chrono::milliseconds attempt_timeout = std::chrono::milliseconds(2000));

    void await_ready(uint16_t host_port,
                     const std::string& health_path,
                     std::chrono::milliseconds timeout) const;

    // http://127.0.0.1:8080/health, exactly one '/' after the port.
    static std::string probe_url(uint16_t host_port, const std::string& health_path);

    std::chrono::milliseconds poll_interval() const { return poll_; }

private:
    static bool probe_once(const std::string& url, std::chrono::milliseconds timeout);

    std::chrono::milliseconds poll_;
    std::chrono::milliseconds attempt_;
};

} // namespace dockgate
