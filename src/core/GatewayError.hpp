#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dockgate {

// ---------------------------------------------------------------------------
// Failure taxonomy. Every kind maps to exactly one HTTP status so a caller
// can tell "bad input" from "not ready yet" from "infrastructure broken".
// ---------------------------------------------------------------------------
enum class ErrorKind : uint8_t {
    PortAllocationFailed,
    RuntimeUnavailable,
    ContainerNotFound,
    NameConflict,
    ImageNotFound,
    InvalidRequest,
    NoPublishedPort,
    OperationFailed,
    ReadinessTimeout,
    UpstreamForwardFailed
};

const char* to_string(ErrorKind kind) noexcept;
unsigned    http_status(ErrorKind kind) noexcept;

class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    unsigned  status() const noexcept { return http_status(kind_); }

private:
    ErrorKind kind_;
};

} // namespace dockgate
