#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace televault::transfer {

enum class TransferDirection {
    UPLOAD,
    DOWNLOAD
};

enum class ChunkStatus {
    STARTED,
    RETRYING,
    COMPLETED,
    SKIPPED,
    FAILED
};

const char* to_string(ChunkStatus status);

struct ProgressEvent {
    TransferDirection direction = TransferDirection::UPLOAD;
    std::string file_id;
    uint64_t chunk_index = 0;
    ChunkStatus status = ChunkStatus::STARTED;

    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    uint64_t chunks_done = 0;
    uint64_t total_chunks = 0;

    double percentage() const {
        if (total_chunks == 0) {
            return 100.0;
        }
        return static_cast<double>(chunks_done) * 100.0 / static_cast<double>(total_chunks);
    }
};

// Bounded queue of progress events. publish() never waits on a consumer: when
// the queue is full the oldest event is dropped.
class ProgressStream {
public:
    explicit ProgressStream(size_t capacity = 1024);

    void publish(ProgressEvent event);

    std::vector<ProgressEvent> drain();
    std::optional<ProgressEvent> wait_next(std::chrono::milliseconds timeout);

    // Wakes waiters; later events are discarded.
    void close();
    bool closed() const { return closed_.load(); }

    uint64_t dropped() const { return dropped_.load(); }
    uint64_t published() const { return published_.load(); }

private:
    size_t capacity_;
    std::deque<ProgressEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> published_{0};
};

// Shared flag checked between chunk tasks.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace televault::transfer
