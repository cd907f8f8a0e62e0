#include "docker/DockerLogStream.hpp"
#include "core/GatewayError.hpp"
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <iostream>

using namespace dockgate;
using json = nlohmann::json;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using local = asio::local::stream_protocol;

static constexpr std::size_t READ_CHUNK = 8192;

DockerLogStream::DockerLogStream(const std::string& socket_path,
                                 const std::string& target,
                                 bool multiplexed)
    : socket_(ioc_), decoder_(multiplexed) {
    // Followed streams have no natural end.
    parser_.body_limit(boost::none);

    boost::system::error_code ec;
    socket_.connect(local::endpoint(socket_path), ec);
    if (ec) {
        throw GatewayError(ErrorKind::RuntimeUnavailable,
                           "runtime socket " + socket_path + " unreachable: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "docker");
    req.set(http::field::user_agent, "dockgate");
    http::write(socket_, req, ec);
    if (!ec) http::read_header(socket_, buffer_, parser_, ec);
    if (ec) {
        throw GatewayError(ErrorKind::RuntimeUnavailable,
                           "runtime log request failed: " + ec.message());
    }

    unsigned status = parser_.get().result_int();
    if (status == 200) return;

    std::string body = read_remaining_body();
    std::string message = body;
    json j = json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) {
        message = j["message"].get<std::string>();
    }

    if (status == 404) throw GatewayError(ErrorKind::ContainerNotFound, message);
    throw GatewayError(ErrorKind::OperationFailed,
                       "logs: runtime returned " + std::to_string(status) + ": " + message);
}

DockerLogStream::~DockerLogStream() {
    boost::system::error_code ec;
    socket_.close(ec);
}

std::string DockerLogStream::read_remaining_body() {
    std::string out;
    char buf[READ_CHUNK];
    while (!parser_.is_done()) {
        parser_.get().body().data = buf;
        parser_.get().body().size = sizeof(buf);
        boost::system::error_code ec;
        http::read(socket_, buffer_, parser_, ec);
        out.append(buf, sizeof(buf) - parser_.get().body().size);
        if (ec == http::error::need_buffer) continue;
        if (ec) break;
    }
    return out;
}

std::optional<std::string> DockerLogStream::next() {
    char buf[READ_CHUNK];
    for (;;) {
        if (auto frame = decoder_.pop()) return std::move(frame->payload);
        if (closed_.load()) return std::nullopt;
        if (eof_) {
            if (decoder_.pending() > 0) {
                std::cerr << "[LOGS] Dropping " << decoder_.pending()
                          << " bytes of truncated frame at end of stream\n";
            }
            return std::nullopt;
        }

        parser_.get().body().data = buf;
        parser_.get().body().size = sizeof(buf);

        boost::system::error_code ec;
        http::read_some(socket_, buffer_, parser_, ec);
        if (ec == http::error::need_buffer) ec = {};

        std::size_t n = sizeof(buf) - parser_.get().body().size;
        if (n > 0) decoder_.feed(buf, n);

        if (parser_.is_done() ||
            ec == http::error::end_of_stream ||
            ec == asio::error::eof) {
            eof_ = true;
            continue;
        }
        if (ec) {
            if (closed_.load()) return std::nullopt;
            throw GatewayError(ErrorKind::OperationFailed,
                               "log stream read failed: " + ec.message());
        }
    }
}

// Called from a thread other than the one blocked in next(). shutdown(2) on
// the descriptor is what wakes the blocked read; the socket object itself is
// only closed by the destructor.
void DockerLogStream::close() {
    if (closed_.exchange(true)) return;
    if (::shutdown(socket_.native_handle(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
        std::cerr << "[LOGS] shutdown: " << std::strerror(errno) << "\n";
    }
}
