#include "televault/storage/catalog_manager.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/random.hpp"
#include <thread>

namespace televault::storage {

CatalogManager::CatalogManager(std::shared_ptr<remote::RemoteChannel> channel,
                               std::string slot,
                               int max_retries,
                               std::chrono::milliseconds retry_delay)
    : channel_(std::move(channel))
    , slot_(std::move(slot))
    , max_retries_(max_retries < 0 ? 0 : max_retries)
    , retry_delay_(retry_delay) {
}

core::VaultResult CatalogManager::load(CatalogIndex& out_index, uint64_t& out_channel_version) {
    remote::PinnedRecord pinned;
    auto status = channel_->pin_and_get(slot_, pinned);
    if (!status) {
        return status;
    }

    out_channel_version = pinned.version;
    if (!pinned.exists) {
        out_index = CatalogIndex{};
        return core::VaultResult();
    }

    status = CatalogIndex::parse(pinned.data, out_index);
    if (!status) {
        LOG_ERROR("Pinned catalog in slot '{}' is unreadable: {}", slot_, status.message);
    }
    return status;
}

core::VaultResult CatalogManager::read(CatalogIndex& out_index) {
    uint64_t channel_version = 0;
    auto status = load(out_index, channel_version);
    if (!status) {
        return status.in_operation("catalog read");
    }
    remember(out_index);
    return status;
}

core::VaultResult CatalogManager::commit(const Mutation& mutation, CatalogIndex& out_index) {
    std::lock_guard<std::mutex> lock(commit_mutex_);

    core::VaultResult last_failure;
    for (int attempt = 0; attempt <= max_retries_; ++attempt) {
        if (attempt > 0) {
            backoff(attempt);
        }

        CatalogIndex current;
        uint64_t channel_version = 0;
        auto status = load(current, channel_version);
        if (!status) {
            if (status.transient()) {
                LOG_WARN("Catalog read failed ({}), retrying", core::to_string(status.error));
                last_failure = status;
                continue;
            }
            return status.in_operation("catalog commit");
        }

        CatalogIndex next = current;
        status = mutation(next);
        if (!status) {
            return status;
        }
        next.version = current.version + 1;
        next.updated_at = core::utils::TimeUtils::now();

        auto payload = next.serialize();
        uint64_t new_channel_version = 0;
        status = channel_->update_pinned(slot_, crypto::as_bytes(payload), channel_version, new_channel_version);
        if (status) {
            LOG_DEBUG("Catalog committed at version {} (attempt {})", next.version, attempt + 1);
            remember(next);
            out_index = std::move(next);
            return core::VaultResult();
        }

        if (status.error == core::VaultError::CONFLICT) {
            LOG_WARN("Catalog version {} was superseded, re-reading (attempt {}/{})",
                     current.version, attempt + 1, max_retries_ + 1);
        } else if (status.transient()) {
            LOG_WARN("Catalog write failed ({}), retrying", core::to_string(status.error));
        } else {
            return status.in_operation("catalog commit");
        }
        last_failure = status;
    }

    return core::VaultResult(core::VaultError::CATALOG_CONTENTION,
        "Gave up after " + std::to_string(max_retries_ + 1) + " attempts")
        .in_operation("catalog commit")
        .caused_by(last_failure.error);
}

core::VaultResult CatalogManager::link_file(const std::string& file_id, const remote::RemoteRef& record_ref) {
    CatalogIndex updated;
    auto status = commit([&](CatalogIndex& index) {
        if (index.is_taken(file_id)) {
            return core::VaultResult(core::VaultError::DUPLICATE_FILE_ID,
                "File id already used in this catalog").for_file(file_id);
        }
        index.files[file_id] = record_ref;
        return core::VaultResult();
    }, updated);

    if (status) {
        LOG_INFO("Linked {} in catalog (version {}, {} files)", file_id, updated.version, updated.files.size());
    }
    return status;
}

core::VaultResult CatalogManager::unlink_file(const std::string& file_id, remote::RemoteRef* out_removed_ref) {
    remote::RemoteRef removed;
    CatalogIndex updated;
    auto status = commit([&](CatalogIndex& index) {
        auto it = index.files.find(file_id);
        if (it == index.files.end()) {
            return core::VaultResult(core::VaultError::NOT_FOUND_IN_CATALOG,
                "No such file in catalog").for_file(file_id);
        }
        removed = it->second;
        index.files.erase(it);
        index.tombstones.insert(file_id);
        return core::VaultResult();
    }, updated);

    if (status) {
        LOG_INFO("Unlinked {} from catalog (version {})", file_id, updated.version);
        if (out_removed_ref) {
            *out_removed_ref = removed;
        }
    }
    return status;
}

core::VaultResult CatalogManager::lookup(const std::string& file_id, remote::RemoteRef& out_ref) {
    CatalogIndex index;
    auto status = read(index);
    if (!status) {
        return status;
    }
    auto ref = index.find(file_id);
    if (!ref) {
        return core::VaultResult(core::VaultError::NOT_FOUND_IN_CATALOG,
            "No such file in catalog").for_file(file_id);
    }
    out_ref = *ref;
    return core::VaultResult();
}

core::VaultResult CatalogManager::fetch_record(const remote::RemoteRef& record_ref, FileRecord& out_record) {
    std::vector<uint8_t> bytes;
    auto status = channel_->get_blob(record_ref, bytes);
    if (!status) {
        return status;
    }
    return FileRecord::parse(bytes, out_record);
}

std::optional<CatalogIndex> CatalogManager::cached() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cached_;
}

void CatalogManager::remember(const CatalogIndex& index) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cached_ = index;
}

void CatalogManager::backoff(int attempt) const {
    if (retry_delay_.count() <= 0) {
        return;
    }
    // Linear growth plus jitter.
    auto base = retry_delay_.count() * attempt;
    auto jitter = crypto::SecureRandom::generate_uniform(static_cast<uint32_t>(retry_delay_.count()) + 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(base + jitter));
}

} // namespace televault::storage
