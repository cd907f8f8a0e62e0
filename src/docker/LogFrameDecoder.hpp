#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace dockgate {

// ---------------------------------------------------------------------------
// Docker attach/log stream demultiplexer.
//
// Containers created without a TTY emit frames:
//   [stream:1][0][0][0][size:4, big endian][payload:size]
// stream 1 = stdout, 2 = stderr (0 = stdin, never seen on output).
// TTY containers emit the raw byte stream, reported as stdout.
//
// feed() appends network bytes in whatever pieces they arrive; pop() yields
// complete payloads in order.
// ---------------------------------------------------------------------------
class LogFrameDecoder {
public:
    static constexpr uint8_t STDOUT = 1;
    static constexpr uint8_t STDERR = 2;

    struct Frame {
        uint8_t     stream{STDOUT};
        std::string payload;
    };

    explicit LogFrameDecoder(bool multiplexed) : multiplexed_(multiplexed) {}

    void feed(const char* data, std::size_t n) { buf_.append(data, n); }
    std::optional<Frame> pop();

    // Bytes left over that do not form a complete frame.
    std::size_t pending() const { return buf_.size(); }

private:
    bool        multiplexed_;
    std::string buf_;
};

} // namespace dockgate
