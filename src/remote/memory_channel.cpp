#include "televault/remote/memory_channel.hpp"
#include <algorithm>
#include <iterator>
#include <thread>

namespace televault::remote {

MemoryChannel::MemoryChannel(uint64_t max_blob_size)
    : max_blob_size_(max_blob_size) {
}

void MemoryChannel::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ms_ = timeout.count();
}

std::chrono::milliseconds MemoryChannel::timeout() const {
    return std::chrono::milliseconds(timeout_ms_.load());
}

void MemoryChannel::set_latency(std::chrono::milliseconds latency) {
    latency_ms_ = latency.count();
}

core::VaultResult MemoryChannel::simulate_latency() const {
    auto latency = latency_ms_.load();
    if (latency <= 0) {
        return core::VaultResult();
    }
    auto timeout = timeout_ms_.load();
    if (latency > timeout) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout));
        return core::VaultResult(core::VaultError::TIMEOUT,
            "Operation exceeded " + std::to_string(timeout) + "ms");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(latency));
    return core::VaultResult();
}

core::VaultResult MemoryChannel::put_blob(std::span<const uint8_t> data,
                                          const std::optional<RemoteRef>& reply_to,
                                          RemoteRef& out_ref) {
    if (data.size() > max_blob_size_) {
        return core::VaultResult(core::VaultError::CHUNK_SIZE_EXCEEDS_LIMIT,
            "Blob of " + std::to_string(data.size()) + " bytes exceeds channel limit");
    }
    auto status = simulate_latency();
    if (!status) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (reply_to && blobs_.count(*reply_to) == 0) {
        return core::VaultResult(core::VaultError::NOT_FOUND, "Reply target " + *reply_to + " does not exist");
    }

    RemoteRef ref = "m" + std::to_string(next_id_++);
    blobs_[ref] = Blob{std::vector<uint8_t>(data.begin(), data.end()), reply_to};
    if (reply_to) {
        replies_[*reply_to].push_back(ref);
    }
    ++put_count_;
    out_ref = std::move(ref);
    return core::VaultResult();
}

core::VaultResult MemoryChannel::get_blob(const RemoteRef& ref, std::vector<uint8_t>& out_data) {
    auto status = simulate_latency();
    if (!status) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(ref);
    if (it == blobs_.end()) {
        return core::VaultResult(core::VaultError::NOT_FOUND, "No blob " + ref);
    }
    out_data = it->second.data;
    return core::VaultResult();
}

core::VaultResult MemoryChannel::pin_and_get(const std::string& slot, PinnedRecord& out_record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pinned_.find(slot);
    if (it == pinned_.end()) {
        out_record = PinnedRecord{};
        return core::VaultResult();
    }
    out_record = it->second;
    return core::VaultResult();
}

core::VaultResult MemoryChannel::update_pinned(const std::string& slot,
                                               std::span<const uint8_t> data,
                                               uint64_t expected_version,
                                               uint64_t& out_new_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = pinned_[slot];
    if (record.version != expected_version) {
        return core::VaultResult(core::VaultError::CONFLICT,
            "Slot '" + slot + "' is at version " + std::to_string(record.version) +
            ", expected " + std::to_string(expected_version));
    }
    record.data.assign(data.begin(), data.end());
    record.version += 1;
    record.exists = true;
    out_new_version = record.version;
    return core::VaultResult();
}

core::VaultResult MemoryChannel::list_replies(const RemoteRef& parent, std::vector<RemoteRef>& out_refs) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_refs.clear();
    auto it = replies_.find(parent);
    if (it == replies_.end()) {
        return core::VaultResult();
    }
    std::copy_if(it->second.begin(), it->second.end(), std::back_inserter(out_refs),
                 [this](const RemoteRef& ref) { return blobs_.count(ref) != 0; });
    return core::VaultResult();
}

core::VaultResult MemoryChannel::delete_blobs(const std::vector<RemoteRef>& refs) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ref : refs) {
        blobs_.erase(ref);
    }
    return core::VaultResult();
}

size_t MemoryChannel::blob_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

bool MemoryChannel::has_blob(const RemoteRef& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.count(ref) != 0;
}

bool MemoryChannel::corrupt_blob(const RemoteRef& ref, size_t offset, uint8_t xor_mask) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(ref);
    if (it == blobs_.end() || offset >= it->second.data.size()) {
        return false;
    }
    it->second.data[offset] ^= xor_mask;
    return true;
}

void MemoryChannel::force_pinned(const std::string& slot, std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = pinned_[slot];
    record.data.assign(data.begin(), data.end());
    record.version += 1;
    record.exists = true;
}

} // namespace televault::remote
