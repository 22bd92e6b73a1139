#pragma once

#include "televault/core/result.hpp"
#include "televault/remote/remote_channel.hpp"
#include "televault/storage/catalog_index.hpp"
#include "televault/storage/file_record.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace televault::storage {

// Owns the pinned catalog record. All writes go through commit(), which runs an
// optimistic read-modify-write loop against the record's version: on a
// conflicting concurrent edit the mutation is re-applied to the fresh index.
class CatalogManager {
public:
    static constexpr const char* DEFAULT_SLOT = "televault.index";
    static constexpr int DEFAULT_MAX_RETRIES = 8;

    // Must be a pure function of its argument: it may run more than once.
    // Returning an error aborts the commit without writing.
    using Mutation = std::function<core::VaultResult(CatalogIndex&)>;

    explicit CatalogManager(std::shared_ptr<remote::RemoteChannel> channel,
                            std::string slot = DEFAULT_SLOT,
                            int max_retries = DEFAULT_MAX_RETRIES,
                            std::chrono::milliseconds retry_delay = std::chrono::milliseconds(20));

    core::VaultResult read(CatalogIndex& out_index);

    core::VaultResult commit(const Mutation& mutation, CatalogIndex& out_index);

    // Fails with DUPLICATE_FILE_ID if the id is live or was ever deleted.
    core::VaultResult link_file(const std::string& file_id, const remote::RemoteRef& record_ref);

    // Removes the entry and tombstones the id.
    core::VaultResult unlink_file(const std::string& file_id, remote::RemoteRef* out_removed_ref = nullptr);

    core::VaultResult lookup(const std::string& file_id, remote::RemoteRef& out_ref);
    core::VaultResult fetch_record(const remote::RemoteRef& record_ref, FileRecord& out_record);

    // Last index this manager read or wrote. Stale as soon as anyone else commits.
    std::optional<CatalogIndex> cached() const;

    const std::string& slot() const { return slot_; }

private:
    std::shared_ptr<remote::RemoteChannel> channel_;
    std::string slot_;
    int max_retries_;
    std::chrono::milliseconds retry_delay_;

    std::mutex commit_mutex_;
    mutable std::mutex cache_mutex_;
    std::optional<CatalogIndex> cached_;

    core::VaultResult load(CatalogIndex& out_index, uint64_t& out_channel_version);
    void remember(const CatalogIndex& index);
    void backoff(int attempt) const;
};

} // namespace televault::storage
