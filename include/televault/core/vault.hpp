#pragma once

#include "televault/core/result.hpp"
#include "televault/remote/remote_channel.hpp"
#include "televault/storage/catalog_manager.hpp"
#include "televault/storage/file_record.hpp"
#include "televault/storage/resume_manager.hpp"
#include "televault/storage/vault_config.hpp"
#include "televault/transfer/progress_stream.hpp"
#include "televault/transfer/transfer_scheduler.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace televault::core {

struct VaultStatus {
    size_t file_count = 0;
    uint64_t total_size = 0;
    uint64_t stored_size = 0;
    double compression_ratio = 1.0;
    uint64_t catalog_version = 0;
    size_t deleted_count = 0;
    size_t unfinished_uploads = 0;
};

// User-level operations over one vault. Composes the channel, the catalog,
// the transfer scheduler and the local resume store.
class Vault {
public:
    Vault(std::shared_ptr<remote::RemoteChannel> channel,
          storage::VaultConfig config,
          std::shared_ptr<transfer::ProgressStream> progress = nullptr,
          std::shared_ptr<transfer::CancellationToken> cancel = nullptr);

    // Checks the configuration against the channel and opens the resume
    // store. A resume store that cannot be opened only disables resuming.
    VaultResult open();

    VaultResult push(const std::filesystem::path& path,
                     const std::string& password,
                     transfer::UploadOutcome& out);

    // An empty output path writes <cwd>/<stored name>.
    VaultResult pull(const std::string& id_or_name,
                     const std::filesystem::path& output,
                     const std::string& password,
                     std::filesystem::path* written_to = nullptr);

    VaultResult list(std::vector<storage::FileRecord>& out);
    VaultResult info(const std::string& id_or_name, storage::FileRecord& out);
    VaultResult search(const std::string& query, std::vector<storage::FileRecord>& out);
    VaultResult remove(const std::string& id_or_name, std::string* removed_id = nullptr);
    VaultResult status(VaultStatus& out);

    // A catalog id wins; otherwise an exact name, then (when allowed) a name
    // containing the query. More than one candidate is AMBIGUOUS_NAME.
    VaultResult resolve(const std::string& id_or_name, bool allow_partial, storage::FileRecord& out);

    transfer::CancellationToken& cancellation() { return *cancel_; }
    const storage::VaultConfig& config() const { return config_; }
    storage::CatalogManager& catalog() { return *catalog_; }

private:
    std::shared_ptr<remote::RemoteChannel> channel_;
    storage::VaultConfig config_;
    std::shared_ptr<transfer::ProgressStream> progress_;

    std::shared_ptr<storage::CatalogManager> catalog_;
    std::shared_ptr<storage::ResumeManager> resume_;
    std::unique_ptr<transfer::TransferScheduler> scheduler_;
    std::shared_ptr<transfer::CancellationToken> cancel_;
    bool opened_ = false;

    VaultResult require_open(const std::string& operation) const;
    VaultResult load_records(const storage::CatalogIndex& index, std::vector<storage::FileRecord>& out);
};

}
