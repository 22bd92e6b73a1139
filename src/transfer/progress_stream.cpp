#include "televault/transfer/progress_stream.hpp"
#include <iterator>

namespace televault::transfer {

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::STARTED: return "started";
        case ChunkStatus::RETRYING: return "retrying";
        case ChunkStatus::COMPLETED: return "completed";
        case ChunkStatus::SKIPPED: return "skipped";
        case ChunkStatus::FAILED: return "failed";
    }
    return "unknown";
}

ProgressStream::ProgressStream(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void ProgressStream::publish(ProgressEvent event) {
    if (closed_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
        ++published_;
    }
    cv_.notify_one();
}

std::vector<ProgressEvent> ProgressStream::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> drained(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
}

std::optional<ProgressEvent> ProgressStream::wait_next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_.load(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void ProgressStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

} // namespace televault::transfer
