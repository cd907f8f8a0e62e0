// =============================================================================
// src/net_test.cpp - Port allocator, URL codec and error mapping
// =============================================================================
// Standalone test. Needs only the loopback interface.
// =============================================================================

#include <set>
#include <boost/asio.hpp>

#include "core/GatewayError.hpp"
#include "net/PortAllocator.hpp"
#include "net/UrlCodec.hpp"
#include "testing/TestHarness.hpp"

using namespace dockgate;
using dockgate::testing::TestHarness;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static void test_port_allocator(TestHarness& t) {
    t.section("Port Allocator");
    PortAllocator ports;

    uint16_t p = ports.reserve();
    t.check(p >= 1, "reserve() returns a port in 1..65535", "got 0");

    // The socket is released before reserve() returns, so the port can be
    // bound again right away.
    asio::io_context ioc;
    tcp::acceptor acc(ioc);
    boost::system::error_code ec;
    tcp::endpoint ep(asio::ip::address_v4::loopback(), p);
    acc.open(ep.protocol(), ec);
    if (!ec) acc.bind(ep, ec);
    t.check(!ec, "reserved port is immediately bindable", ec.message());
    acc.close(ec);

    std::set<uint16_t> seen;
    bool all_valid = true;
    for (int i = 0; i < 20; ++i) {
        uint16_t q = ports.reserve();
        all_valid = all_valid && q != 0;
        seen.insert(q);
    }
    t.check(all_valid, "20 consecutive reservations all succeed");
    t.check(seen.size() > 1, "reservations are not pinned to one port");
}

static void test_url_codec(TestHarness& t) {
    t.section("URL Codec");

    t.equal(url_encode("abc-_.~XYZ09"), std::string("abc-_.~XYZ09"), "unreserved characters pass through");
    t.equal(url_encode("a b/c"), std::string("a%20b%2Fc"), "space and slash are escaped");
    t.equal(url_encode("{\"label\":[\"x\"]}"), std::string("%7B%22label%22%3A%5B%22x%22%5D%7D"),
            "JSON filter is fully escaped");

    t.equal(url_decode("a%20b+c"), std::string("a b c"), "%XX and + decode");
    t.equal(url_decode("100%"), std::string("100%"), "trailing % kept literally");
    t.equal(url_decode("%zz"), std::string("%zz"), "invalid escape kept literally");

    auto q = parse_query("tail=10&follow=true&x=a%20b&tail=20&flag");
    t.equal(q["tail"], std::string("20"), "repeated key: last wins");
    t.equal(q["follow"], std::string("true"), "plain value");
    t.equal(q["x"], std::string("a b"), "value is decoded");
    t.check(q.count("flag") == 1 && q["flag"].empty(), "key without '=' maps to empty value");
    t.check(parse_query("").empty(), "empty query yields no keys");
}

static void test_error_mapping(TestHarness& t) {
    t.section("Error Kind → HTTP status");

    t.equal(http_status(ErrorKind::PortAllocationFailed), 500u, "PortAllocationFailed → 500");
    t.equal(http_status(ErrorKind::RuntimeUnavailable), 503u, "RuntimeUnavailable → 503");
    t.equal(http_status(ErrorKind::ContainerNotFound), 404u, "ContainerNotFound → 404");
    t.equal(http_status(ErrorKind::NameConflict), 400u, "NameConflict → 400");
    t.equal(http_status(ErrorKind::ImageNotFound), 400u, "ImageNotFound → 400");
    t.equal(http_status(ErrorKind::InvalidRequest), 400u, "InvalidRequest → 400");
    t.equal(http_status(ErrorKind::NoPublishedPort), 400u, "NoPublishedPort → 400");
    t.equal(http_status(ErrorKind::OperationFailed), 500u, "OperationFailed → 500");
    t.equal(http_status(ErrorKind::ReadinessTimeout), 504u, "ReadinessTimeout → 504");
    t.equal(http_status(ErrorKind::UpstreamForwardFailed), 502u, "UpstreamForwardFailed → 502");

    GatewayError e(ErrorKind::NoPublishedPort, "Container has no published port");
    t.equal(e.status(), 400u, "GatewayError::status() follows its kind");
    t.equal(std::string(e.what()), std::string("Container has no published port"), "message preserved");
}

int main() {
    TestHarness t("DOCKGATE - NET / ERRORS");
    test_port_allocator(t);
    test_url_codec(t);
    test_error_mapping(t);
    return t.summary();
}
