#pragma once

#include "televault/core/result.hpp"
#include "televault/crypto/chunk_pipeline.hpp"
#include "televault/crypto/key_derivation.hpp"
#include "televault/remote/remote_channel.hpp"
#include "televault/storage/catalog_manager.hpp"
#include "televault/storage/file_record.hpp"
#include "televault/storage/resume_manager.hpp"
#include "televault/storage/vault_config.hpp"
#include "televault/transfer/progress_stream.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace televault::transfer {

struct TransferOptions {
    uint64_t chunk_size = storage::VaultConfig::DEFAULT_CHUNK_SIZE;
    int parallelism = 3;
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds chunk_timeout{300000};
    bool encrypted = true;
    bool compressed = true;
    crypto::KdfParams kdf;

    static TransferOptions for_upload(const storage::VaultConfig& config);
    static TransferOptions for_download(const storage::VaultConfig& config);

    core::VaultResult validate(uint64_t channel_max_blob_size) const;
};

struct UploadRequest {
    std::filesystem::path source;
    std::string name;           // defaults to the source file name
    std::string password;
    TransferOptions options;
    bool resume = true;
};

struct UploadOutcome {
    storage::FileRecord record;
    remote::RemoteRef record_ref;
    uint64_t chunks_uploaded = 0;
    uint64_t chunks_skipped = 0;
    bool resumed = false;
};

struct DownloadRequest {
    storage::FileRecord record;
    std::filesystem::path output;
    std::string password;
    TransferOptions options;
};

// Drives chunk uploads and downloads over a bounded worker pool.
//
// Each operation gets its own Boost.Asio thread_pool of `parallelism` workers.
// Workers pull chunk indices from a shared cursor and retry transient channel
// failures in place, so a retry never widens the concurrency. The first
// unrecoverable chunk stops the others at their next task boundary.
class TransferScheduler {
public:
    TransferScheduler(std::shared_ptr<remote::RemoteChannel> channel,
                      std::shared_ptr<storage::CatalogManager> catalog,
                      std::shared_ptr<storage::ResumeManager> resume = nullptr,
                      std::shared_ptr<ProgressStream> progress = nullptr);

    // Uploads the chunks, writes the FileRecord and links it in the catalog.
    core::VaultResult upload(const UploadRequest& request,
                             const CancellationToken& cancel,
                             UploadOutcome& out);

    // Writes to <output>.part and renames on success; the partial file is
    // removed on any failure.
    core::VaultResult download(const DownloadRequest& request,
                               const CancellationToken& cancel);

    // Catalog removal is authoritative; blob cleanup afterwards is best effort.
    core::VaultResult remove(const std::string& file_id);

private:
    std::shared_ptr<remote::RemoteChannel> channel_;
    std::shared_ptr<storage::CatalogManager> catalog_;
    std::shared_ptr<storage::ResumeManager> resume_;
    std::shared_ptr<ProgressStream> progress_;

    struct UploadPlan;

    core::VaultResult prepare_upload(const UploadRequest& request, UploadPlan& plan);
    std::optional<storage::TransferProgress> find_resumable(const UploadRequest& request,
                                                            const UploadPlan& plan);
    core::VaultResult start_fresh(const UploadRequest& request, UploadPlan& plan);

    core::VaultResult with_retries(const TransferOptions& options,
                                   const CancellationToken& cancel,
                                   const std::function<core::VaultResult()>& operation,
                                   const ProgressEvent& context);

    void publish(const ProgressEvent& event);
};

} // namespace televault::transfer
