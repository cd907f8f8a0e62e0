#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>

#include "docker/ContainerRuntime.hpp"
#include "docker/LogFrameDecoder.hpp"

namespace dockgate {

// ---------------------------------------------------------------------------
// GET /containers/{id}/logs read incrementally over the runtime unix socket.
//
// libcurl only offers push-style delivery, so this one call talks HTTP to the
// daemon directly: Beast parses the response with a buffer_body and next()
// performs one socket read at a time, returning as soon as a complete log
// payload is available. A followed stream blocks in next() until the
// container writes or close() shuts the socket down from another thread.
//
// The constructor connects, sends the request and reads the response header.
// Throws GatewayError: RuntimeUnavailable (connect), ContainerNotFound (404),
// OperationFailed (any other non-200).
// ---------------------------------------------------------------------------
class DockerLogStream final : public ChunkSource {
public:
    DockerLogStream(const std::string& socket_path,
                    const std::string& target,
                    bool multiplexed);
    ~DockerLogStream() override;

    DockerLogStream(const DockerLogStream&) = delete;
    DockerLogStream& operator=(const DockerLogStream&) = delete;

    std::optional<std::string> next() override;
    void close() override;

private:
    std::string read_remaining_body();

    boost::asio::io_context                 ioc_;
    boost::asio::local::stream_protocol::socket socket_;
    boost::beast::flat_buffer               buffer_;
    boost::beast::http::response_parser<boost::beast::http::buffer_body> parser_;
    LogFrameDecoder                         decoder_;
    std::atomic<bool>                       closed_{false};
    bool                                    eof_{false};
};

} // namespace dockgate
