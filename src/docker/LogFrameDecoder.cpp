#include "docker/LogFrameDecoder.hpp"

using namespace dockgate;

static constexpr std::size_t HEADER_LEN = 8;

std::optional<LogFrameDecoder::Frame> LogFrameDecoder::pop() {
    if (!multiplexed_) {
        if (buf_.empty()) return std::nullopt;
        Frame f;
        f.payload.swap(buf_);
        return f;
    }

    // Empty frames carry nothing for the consumer; skip them.
    while (buf_.size() >= HEADER_LEN) {
        const auto* h = reinterpret_cast<const unsigned char*>(buf_.data());
        uint32_t size = (static_cast<uint32_t>(h[4]) << 24) |
                        (static_cast<uint32_t>(h[5]) << 16) |
                        (static_cast<uint32_t>(h[6]) << 8)  |
                         static_cast<uint32_t>(h[7]);

        if (buf_.size() < HEADER_LEN + size) return std::nullopt;

        Frame f;
        f.stream = h[0];
        f.payload = buf_.substr(HEADER_LEN, size);
        buf_.erase(0, HEADER_LEN + size);
        if (!f.payload.empty()) return f;
    }
    return std::nullopt;
}
