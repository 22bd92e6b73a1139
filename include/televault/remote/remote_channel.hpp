#pragma once

#include "televault/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace televault::remote {

// Opaque handle to one stored blob.
using RemoteRef = std::string;

struct PinnedRecord {
    std::vector<uint8_t> data;
    uint64_t version = 0;
    bool exists = false;
};

// Message-store abstraction the vault is built on: opaque blobs that may be
// threaded as replies to a parent blob, plus named pinned records that can be
// edited in place under a version check.
//
// Transient failures are reported as TRANSIENT, TIMEOUT or RATE_LIMITED.
// Implementations must be safe to call from several threads.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    virtual core::VaultResult put_blob(std::span<const uint8_t> data,
                                       const std::optional<RemoteRef>& reply_to,
                                       RemoteRef& out_ref) = 0;

    // NOT_FOUND when the blob does not exist (or was deleted).
    virtual core::VaultResult get_blob(const RemoteRef& ref, std::vector<uint8_t>& out_data) = 0;

    // A slot that was never written yields exists == false at version 0.
    virtual core::VaultResult pin_and_get(const std::string& slot, PinnedRecord& out_record) = 0;

    // CONFLICT when the slot's current version is not expected_version.
    virtual core::VaultResult update_pinned(const std::string& slot,
                                            std::span<const uint8_t> data,
                                            uint64_t expected_version,
                                            uint64_t& out_new_version) = 0;

    // Replies in the order they were put.
    virtual core::VaultResult list_replies(const RemoteRef& parent, std::vector<RemoteRef>& out_refs) = 0;

    // Best effort. Unknown refs are skipped; UNSUPPORTED when the backend
    // cannot delete at all.
    virtual core::VaultResult delete_blobs(const std::vector<RemoteRef>& refs) = 0;

    virtual uint64_t max_blob_size() const = 0;

    // Per-operation deadline; an operation that exceeds it reports TIMEOUT.
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;
    virtual std::chrono::milliseconds timeout() const = 0;
};

} // namespace televault::remote
