#pragma once

#include "televault/remote/remote_channel.hpp"
#include <atomic>
#include <filesystem>

namespace televault::remote {

// Channel backed by a local directory, shareable between processes:
//
//   <root>/blobs/<ref>            one file per blob, written via rename
//   <root>/replies/<parent>       newline separated child refs, appended under flock
//   <root>/pinned/<slot>.pin      8-byte little-endian version followed by the payload
//   <root>/pinned/<slot>.lock     flock target serializing edits of one slot
class DirectoryChannel : public RemoteChannel {
public:
    static constexpr uint64_t DEFAULT_MAX_BLOB_SIZE = 2048ULL * 1024 * 1024;

    explicit DirectoryChannel(const std::filesystem::path& root,
                              uint64_t max_blob_size = DEFAULT_MAX_BLOB_SIZE);

    // Creates the directory layout.
    core::VaultResult open();

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

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    uint64_t max_blob_size_;
    std::atomic<int64_t> timeout_ms_{30000};

    std::filesystem::path blob_path(const RemoteRef& ref) const;
    std::filesystem::path replies_path(const RemoteRef& parent) const;
    std::filesystem::path pin_path(const std::string& slot) const;
    std::filesystem::path lock_path(const std::string& slot) const;

    core::VaultResult read_pinned(const std::string& slot, PinnedRecord& out_record) const;
    static bool valid_name(const std::string& name);
};

} // namespace televault::remote
