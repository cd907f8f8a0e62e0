#include "server/GatewayServer.hpp"
#include "logs/LogStreamBridge.hpp"
#include "server/Router.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <poll.h>
#include <sys/socket.h>

using namespace dockgate;
namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

static constexpr uint64_t MAX_REQUEST_BODY = 64ull * 1024 * 1024;
static constexpr auto     ACCEPT_IDLE      = std::chrono::milliseconds(50);
static constexpr auto     CLIENT_CHECK     = std::chrono::milliseconds(200);

GatewayServer::GatewayServer(std::string address, uint16_t port, Router& router, int max_connections)
    : address_(std::move(address)),
      port_(port),
      router_(router),
      max_connections_(max_connections > 0 ? static_cast<size_t>(max_connections) : 1) {}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    if (running_.load()) return;

    beast::error_code ec;
    auto addr = asio::ip::make_address(address_, ec);
    if (ec) throw std::runtime_error("invalid listen address " + address_ + ": " + ec.message());

    auto acceptor = std::make_unique<tcp::acceptor>(ioc_);
    tcp::endpoint ep(addr, port_);
    acceptor->open(ep.protocol(), ec);
    if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor->bind(ep, ec);
    if (!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
    if (!ec) acceptor->non_blocking(true, ec);
    if (ec) {
        throw std::runtime_error("cannot listen on " + address_ + ":" + std::to_string(port_) +
                                 ": " + ec.message());
    }

    bound_port_ = acceptor->local_endpoint().port();
    acceptor_   = std::move(acceptor);
    running_.store(true);
    accept_thread_ = std::thread([this]() { accept_loop(); });

    std::cout << "[GATEWAY] Listening on " << address_ << ":" << bound_port_ << "\n";
}

void GatewayServer::stop() {
    if (!running_.exchange(false)) return;
    if (accept_thread_.joinable()) accept_thread_.join();

    beast::error_code ec;
    acceptor_->close(ec);

    std::list<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lk(sessions_mtx_);
        for (auto& s : sessions_) {
            // Unblocks a session parked in read(); the fd stays owned by the session.
            ::shutdown(s->socket->native_handle(), SHUT_RDWR);
        }
        sessions.swap(sessions_);
    }
    for (auto& s : sessions) {
        if (s->worker.joinable()) s->worker.join();
    }
    std::cout << "[GATEWAY] Stopped (" << sessions.size() << " sessions closed)\n";
}

size_t GatewayServer::active_sessions() {
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    size_t n = 0;
    for (const auto& s : sessions_) {
        if (!s->done.load()) ++n;
    }
    return n;
}

void GatewayServer::reap_finished() {
    std::lock_guard<std::mutex> lk(sessions_mtx_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->worker.joinable()) (*it)->worker.join();
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

void GatewayServer::accept_loop() {
    while (running_.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(ACCEPT_IDLE);
            continue;
        }
        if (ec) {
            std::cerr << "[GATEWAY] Accept failed: " << ec.message() << "\n";
            std::this_thread::sleep_for(ACCEPT_IDLE);
            continue;
        }

        reap_finished();
        if (active_sessions() >= max_connections_) {
            reject_busy(socket);
            continue;
        }

        auto session    = std::make_shared<Session>();
        session->socket = std::make_shared<tcp::socket>(std::move(socket));

        std::lock_guard<std::mutex> lk(sessions_mtx_);
        session->worker = std::thread([this, session]() {
            serve(*session->socket);
            session->done.store(true);
        });
        sessions_.push_back(session);
    }
}

void GatewayServer::reject_busy(tcp::socket& sock) {
    std::cerr << "[GATEWAY] Connection limit (" << max_connections_ << ") reached, rejecting\n";

    Response res{http::status::service_unavailable, 11};
    res.set(http::field::server, "dockgate");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = nlohmann::json{{"detail", "server busy"}}.dump();
    res.prepare_payload();

    beast::error_code ec;
    http::write(sock, res, ec);
    sock.shutdown(tcp::socket::shutdown_both, ec);
}

void GatewayServer::serve(tcp::socket& sock) {
    beast::flat_buffer buffer;
    beast::error_code  ec;

    while (running_.load()) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(MAX_REQUEST_BODY);

        http::read_header(sock, buffer, parser, ec);
        if (ec == http::error::end_of_stream || ec == asio::error::eof) break;
        if (!ec && beast::iequals(parser.get()[http::field::expect], "100-continue")) {
            http::response<http::empty_body> cont{http::status::continue_, parser.get().version()};
            http::write(sock, cont, ec);
        }
        if (!ec && !parser.is_done()) http::read(sock, buffer, parser, ec);

        if (ec) {
            if (ec == http::error::body_limit) {
                Request dummy;
                Response res = Router::error_response(dummy, 413, "request body too large");
                res.keep_alive(false);
                http::write(sock, res, ec);
            } else if (ec != asio::error::connection_reset && ec != asio::error::shut_down &&
                       ec != asio::error::bad_descriptor && ec != asio::error::operation_aborted &&
                       ec != asio::error::not_connected) {
                Request dummy;
                Response res = Router::error_response(dummy, 400, "malformed request: " + ec.message());
                res.keep_alive(false);
                beast::error_code wec;
                http::write(sock, res, wec);
            }
            break;
        }

        Request req = parser.release();
        RouteResult route = router_.handle(req);
        bool keep_alive = route.response.keep_alive();

        if (route.stream) {
            keep_alive = stream_body(sock, route) && keep_alive;
        } else {
            http::write(sock, route.response, ec);
            if (ec) break;
        }
        if (!keep_alive) break;
    }

    sock.shutdown(tcp::socket::shutdown_send, ec);
}

bool GatewayServer::peer_closed(tcp::socket& sock) {
    pollfd pfd{};
    pfd.fd     = sock.native_handle();
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) return rc < 0 && errno != EINTR;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return true;

    char c;
    ssize_t n = ::recv(pfd.fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n == 0) return true;
    if (n < 0) return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    return false;   // pipelined request bytes; leave them for the next read
}

// ---------------------------------------------------------------------------
// Chunked relay of a log stream. The bridge worker pulls from the runtime;
// this thread owns the socket and is the only one writing to it. Returns
// true when the terminating chunk went out and the connection is reusable.
// ---------------------------------------------------------------------------
bool GatewayServer::stream_body(tcp::socket& sock, RouteResult& route) {
    beast::error_code ec;

    http::response<http::empty_body> head{std::move(route.response.base())};
    http::response_serializer<http::empty_body> sr{head};
    http::write_header(sock, sr, ec);
    if (ec) return false;

    std::mutex                 mtx;
    std::condition_variable    cv;
    std::optional<std::string> pending;
    bool                       done = false;
    std::string                error;

    LogStreamBridge bridge(std::move(route.stream));
    bridge.start(
        [&](std::string chunk) {
            std::lock_guard<std::mutex> lk(mtx);
            pending = std::move(chunk);
            cv.notify_one();
        },
        [&](const std::string& err) {
            std::lock_guard<std::mutex> lk(mtx);
            done  = true;
            error = err;
            cv.notify_one();
        });

    uint64_t bytes = 0;
    for (;;) {
        std::optional<std::string> chunk;
        bool        finished = false;
        std::string failure;
        {
            std::unique_lock<std::mutex> lk(mtx);
            cv.wait_for(lk, CLIENT_CHECK, [&]() { return pending.has_value() || done; });
            if (pending) {
                chunk.swap(pending);
            } else if (done) {
                finished = true;
                failure  = error;
            }
        }

        if (chunk) {
            // An empty chunk would read as the terminator.
            if (!chunk->empty()) {
                asio::write(sock, http::make_chunk(asio::buffer(*chunk)), ec);
                if (ec) {
                    std::cout << "[LOGS] Client write failed (" << ec.message() << "), cancelling\n";
                    bridge.cancel();
                    return false;
                }
                bytes += chunk->size();
            }
            bridge.ack();
            continue;
        }

        if (finished) {
            // A failed stream is cut without the terminator so the client
            // sees a truncated body rather than a clean end.
            if (!failure.empty()) return false;
            asio::write(sock, http::make_chunk_last(), ec);
            return !ec;
        }

        if (!running_.load() || peer_closed(sock)) {
            std::cout << "[LOGS] Client disconnected after " << bytes << " bytes, cancelling\n";
            bridge.cancel();
            return false;
        }
    }
}
