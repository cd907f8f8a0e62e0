#pragma once
#include <cstdint>
#include <boost/asio/io_context.hpp>

namespace dockgate {

// ---------------------------------------------------------------------------
// Ephemeral loopback port reservation.
//
// reserve() binds a throwaway TCP socket to 127.0.0.1:0, reads back the port
// the kernel picked and closes the socket before returning. The reservation
// is advisory: another process may grab the port before the container
// runtime binds it. The socket is never held open because the runtime needs
// the port free to publish it.
//
// Throws GatewayError(PortAllocationFailed) when the kernel has nothing left.
// ---------------------------------------------------------------------------
class PortAllocator {
public:
    PortAllocator() = default;

    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    uint16_t reserve();

private:
    boost::asio::io_context ioc_;
};

} // namespace dockgate
