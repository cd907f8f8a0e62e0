#include "logs/LogStreamBridge.hpp"
#include <iostream>

using namespace dockgate;

LogStreamBridge::LogStreamBridge(std::unique_ptr<ChunkSource> source)
    : source_(std::move(source)) {}

LogStreamBridge::~LogStreamBridge() {
    cancel();
    if (worker_.joinable()) worker_.join();
}

void LogStreamBridge::start(ChunkHandler on_chunk, DoneHandler on_done) {
    if (started_.exchange(true)) return;  // single use
    on_chunk_ = std::move(on_chunk);
    on_done_  = std::move(on_done);
    worker_   = std::thread([this]() { run(); });
}

void LogStreamBridge::ack() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        in_flight_ = false;
    }
    cv_.notify_all();
}

void LogStreamBridge::cancel() {
    // Set under mtx_ so a worker between its predicate check and the wait
    // cannot miss the notify.
    bool already = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        already = cancelled_.exchange(true);
    }
    if (already) return;
    if (source_) source_->close();
    cv_.notify_all();
}

void LogStreamBridge::run() {
    std::string error;
    uint64_t    delivered = 0;

    while (!cancelled_.load()) {
        std::optional<std::string> chunk;
        try {
            chunk = source_->next();
        } catch (const std::exception& e) {
            if (!cancelled_.load()) error = e.what();
            break;
        }
        if (!chunk || cancelled_.load()) break;

        {
            std::lock_guard<std::mutex> lk(mtx_);
            in_flight_ = true;
        }
        try {
            on_chunk_(std::move(*chunk));
        } catch (const std::exception& e) {
            error = std::string("chunk delivery failed: ") + e.what();
            break;
        }
        ++delivered;

        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this]() { return !in_flight_ || cancelled_.load(); });
    }

    // Releases the runtime connection. A stream that was cancelled from
    // outside gets no completion callback.
    const bool was_cancelled = cancelled_.exchange(true);
    if (!was_cancelled) source_->close();
    finished_.store(true);

    if (!error.empty()) {
        std::cerr << "[LOGS] Stream failed after " << delivered << " chunks: " << error << "\n";
    }
    if (!was_cancelled && on_done_) on_done_(error);
}
