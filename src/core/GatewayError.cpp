#include "core/GatewayError.hpp"

using namespace dockgate;

const char* dockgate::to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::PortAllocationFailed:  return "PortAllocationFailed";
        case ErrorKind::RuntimeUnavailable:    return "RuntimeUnavailable";
        case ErrorKind::ContainerNotFound:     return "ContainerNotFound";
        case ErrorKind::NameConflict:          return "NameConflict";
        case ErrorKind::ImageNotFound:         return "ImageNotFound";
        case ErrorKind::InvalidRequest:        return "InvalidRequest";
        case ErrorKind::NoPublishedPort:       return "NoPublishedPort";
        case ErrorKind::OperationFailed:       return "OperationFailed";
        case ErrorKind::ReadinessTimeout:      return "ReadinessTimeout";
        case ErrorKind::UpstreamForwardFailed: return "UpstreamForwardFailed";
    }
    return "Unknown";
}

unsigned dockgate::http_status(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ContainerNotFound:     return 404;
        case ErrorKind::NameConflict:
        case ErrorKind::ImageNotFound:
        case ErrorKind::InvalidRequest:
        case ErrorKind::NoPublishedPort:       return 400;
        case ErrorKind::RuntimeUnavailable:    return 503;
        case ErrorKind::ReadinessTimeout:      return 504;
        case ErrorKind::UpstreamForwardFailed: return 502;
        case ErrorKind::PortAllocationFailed:
        case ErrorKind::OperationFailed:       return 500;
    }
    return 500;
}
