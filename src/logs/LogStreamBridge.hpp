#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "docker/ContainerRuntime.hpp"

namespace dockgate {

// ---------------------------------------------------------------------------
// Pull-to-push adapter for log streams.
//
// A dedicated worker calls the blocking ChunkSource::next() and hands each
// chunk to on_chunk. It does not pull again until the consumer calls ack(),
// so at most one chunk is ever in flight and order is preserved.
//
// on_done fires exactly once when the source is exhausted (error empty) or
// fails (error set). After cancel() neither callback fires again.
//
// THREADING: callbacks run on the worker thread. ack() and cancel() may be
// called from any thread. The destructor cancels and joins.
// ---------------------------------------------------------------------------
class LogStreamBridge {
public:
    using ChunkHandler = std::function<void(std::string chunk)>;
    using DoneHandler  = std::function<void(const std::string& error)>;

    explicit LogStreamBridge(std::unique_ptr<ChunkSource> source);
    ~LogStreamBridge();

    LogStreamBridge(const LogStreamBridge&)            = delete;
    LogStreamBridge& operator=(const LogStreamBridge&) = delete;

    void start(ChunkHandler on_chunk, DoneHandler on_done);
    void ack();

    // Closes the source, unblocking a pending next(), and stops delivery.
    void cancel();

    bool finished() const { return finished_.load(); }

private:
    void run();

    std::unique_ptr<ChunkSource> source_;
    ChunkHandler                 on_chunk_;
    DoneHandler                  on_done_;

    std::mutex              mtx_;
    std::condition_variable cv_;
    bool                    in_flight_{false};

    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::thread       worker_;
};

} // namespace dockgate
