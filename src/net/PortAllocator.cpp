#include "net/PortAllocator.hpp"
#include "core/GatewayError.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <iostream>

using namespace dockgate;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

uint16_t PortAllocator::reserve() {
    boost::system::error_code ec;
    tcp::socket sock(ioc_);
    tcp::endpoint ep(asio::ip::address_v4::loopback(), 0);

    sock.open(ep.protocol(), ec);
    if (!ec) sock.bind(ep, ec);

    uint16_t port = 0;
    if (!ec) port = sock.local_endpoint(ec).port();

    // Release before returning, whatever happened above.
    boost::system::error_code close_ec;
    sock.close(close_ec);
    if (close_ec) {
        std::cerr << "[PORT] close after reserve: " << close_ec.message() << "\n";
    }

    if (ec || port == 0) {
        throw GatewayError(ErrorKind::PortAllocationFailed,
                           "no ephemeral port available on 127.0.0.1: " +
                           (ec ? ec.message() : std::string("kernel returned port 0")));
    }
    return port;
}
