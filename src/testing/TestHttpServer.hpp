#pragma once
// =============================================================================
// Loopback HTTP server for tests that need a real upstream: readiness probes,
// proxy forwarding. Binds 127.0.0.1:0, serves one request per connection on a
// background thread and records what it received.
// =============================================================================

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace dockgate::testing {

class TestHttpServer {
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler  = std::function<Response(const Request&)>;

    explicit TestHttpServer(Handler handler)
        : handler_(std::move(handler)), acceptor_(ioc_) {
        using tcp = boost::asio::ip::tcp;
        tcp::endpoint ep(boost::asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(ep.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        acceptor_.non_blocking(true);
        port_ = acceptor_.local_endpoint().port();

        running_.store(true);
        worker_ = std::thread([this]() { run(); });
    }

    ~TestHttpServer() { stop(); }

    TestHttpServer(const TestHttpServer&)            = delete;
    TestHttpServer& operator=(const TestHttpServer&) = delete;

    void stop() {
        if (!running_.exchange(false)) return;
        if (worker_.joinable()) worker_.join();
        boost::system::error_code ec;
        acceptor_.close(ec);
    }

    uint16_t port() const { return port_; }
    int      connections() const { return connections_.load(); }

    std::vector<Request> requests() {
        std::lock_guard<std::mutex> lk(mtx_);
        return seen_;
    }

    Request last_request() {
        std::lock_guard<std::mutex> lk(mtx_);
        return seen_.empty() ? Request{} : seen_.back();
    }

    // Plain response with Connection: close.
    static Response reply(const Request& req, unsigned status, std::string body,
                          const char* content_type = "text/plain") {
        namespace http = boost::beast::http;
        Response res{static_cast<http::status>(status), req.version()};
        res.set(http::field::content_type, content_type);
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

private:
    void run() {
        namespace beast = boost::beast;
        namespace http  = beast::http;
        using tcp = boost::asio::ip::tcp;

        while (running_.load()) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);

            if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            if (ec) continue;
            connections_++;

            beast::flat_buffer buffer;
            Request req;
            http::read(socket, buffer, req, ec);
            if (ec) continue;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                seen_.push_back(req);
            }

            Response res = handler_(req);
            res.keep_alive(false);
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    Handler                        handler_;
    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t                       port_{0};

    std::atomic<bool> running_{false};
    std::atomic<int>  connections_{0};
    std::thread       worker_;

    std::mutex           mtx_;
    std::vector<Request> seen_;
};

} // namespace dockgate::testing
