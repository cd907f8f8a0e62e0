#pragma once
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>

namespace dockgate {

class Router;
struct RouteResult;

// ---------------------------------------------------------------------------
// Synchronous Beast HTTP/1.1 server.
//
// One accept thread polls a non-blocking acceptor; every accepted connection
// gets its own session thread that reads requests, hands them to the Router
// and writes the responses (keep-alive supported). Handlers may block for as
// long as they like without stalling other clients.
//
// Log responses are relayed chunk by chunk from a LogStreamBridge. While a
// stream is idle the session watches the client socket and cancels the
// bridge as soon as the peer disconnects.
//
// Connections over max_connections get an immediate 503 and are closed.
//
// stop(): accept loop exits, every open session socket is shut down so
// blocked reads return, session threads are joined. A session in the middle
// of a long handler (readiness wait) finishes that handler first.
// ---------------------------------------------------------------------------
class GatewayServer {
public:
    GatewayServer(std::string address, uint16_t port, Router& router, int max_connections);
    ~GatewayServer();

    GatewayServer(const GatewayServer&)            = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Binds and starts accepting. Throws std::runtime_error if the address
    // cannot be bound.
    void start();
    void stop();

    // Actual bound port; differs from the configured one when that was 0.
    uint16_t port() const { return bound_port_; }
    bool     running() const { return running_.load(); }
    size_t   active_sessions();

private:
    struct Session {
        std::shared_ptr<boost::asio::ip::tcp::socket> socket;
        std::thread                                   worker;
        std::atomic<bool>                             done{false};
    };

    void accept_loop();
    void serve(boost::asio::ip::tcp::socket& sock);
    bool stream_body(boost::asio::ip::tcp::socket& sock, RouteResult& route);
    void reap_finished();
    void reject_busy(boost::asio::ip::tcp::socket& sock);

    static bool peer_closed(boost::asio::ip::tcp::socket& sock);

    std::string address_;
    uint16_t    port_;
    uint16_t    bound_port_{0};
    Router&     router_;
    size_t      max_connections_;

    boost::asio::io_context                         ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread                                     accept_thread_;
    std::atomic<bool>                               running_{false};

    std::mutex                          sessions_mtx_;
    std::list<std::shared_ptr<Session>> sessions_;
};

} // namespace dockgate
