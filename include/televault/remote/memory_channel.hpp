#pragma once

#include "televault/remote/remote_channel.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>

namespace televault::remote {

// In-process channel. Used by tests and as the reference behaviour for the
// RemoteChannel contract.
class MemoryChannel : public RemoteChannel {
public:
    static constexpr uint64_t DEFAULT_MAX_BLOB_SIZE = 2048ULL * 1024 * 1024;

    explicit MemoryChannel(uint64_t max_blob_size = DEFAULT_MAX_BLOB_SIZE);

    core::VaultResult put_blob(std::span<const uint8_t> data,
                               const std::optional<RemoteRef>& reply_to,
                               RemoteRef& out_ref) override;
    core::VaultResult get_blob(const RemoteRef& ref, std::vector<uint8_t>& out_data) override;
    core::VaultResult pin_and_get(const std::string& slot, PinnedRecord& out_record) override;
    core::VaultResult update_pinned(const std::string& slot,
                                    std::span<const uint8_t> data,
                                    uint64_t expected_version,
                                    uint64_t& out_new_version) override;
    core::VaultResult list_replies(const RemoteRef& parent, std::vector<RemoteRef>& out_refs) override;
    core::VaultResult delete_blobs(const std::vector<RemoteRef>& refs) override;

    uint64_t max_blob_size() const override { return max_blob_size_; }
    void set_timeout(std::chrono::milliseconds timeout) override;
    std::chrono::milliseconds timeout() const override;

    // Every blob operation sleeps this long; past the timeout it fails with TIMEOUT.
    void set_latency(std::chrono::milliseconds latency);

    size_t blob_count() const;
    bool has_blob(const RemoteRef& ref) const;
    uint64_t put_count() const { return put_count_.load(); }

    // Flips bits of a stored blob in place. Returns false for an unknown ref
    // or an offset past the end.
    bool corrupt_blob(const RemoteRef& ref, size_t offset, uint8_t xor_mask = 0x01);

    // Overwrites a pinned slot without a version check.
    void force_pinned(const std::string& slot, std::span<const uint8_t> data);

private:
    struct Blob {
        std::vector<uint8_t> data;
        std::optional<RemoteRef> parent;
    };

    uint64_t max_blob_size_;
    std::atomic<int64_t> timeout_ms_{30000};
    std::atomic<int64_t> latency_ms_{0};
    std::atomic<uint64_t> put_count_{0};

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::unordered_map<RemoteRef, Blob> blobs_;
    std::unordered_map<RemoteRef, std::vector<RemoteRef>> replies_;
    std::map<std::string, PinnedRecord> pinned_;

    core::VaultResult simulate_latency() const;
};

} // namespace televault::remote
