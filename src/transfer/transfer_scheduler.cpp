#include "televault/transfer/transfer_scheduler.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/compression.hpp"
#include "televault/crypto/hash.hpp"
#include "televault/crypto/random.hpp"
#include "televault/storage/chunker.hpp"
#include "televault/storage/reassembler.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>

namespace televault::transfer {

using core::VaultError;
using core::VaultResult;
using core::utils::TimeUtils;

namespace {

constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(50);
constexpr auto MAX_BACKOFF = std::chrono::milliseconds(60000);

// Sleeps for `duration` unless the token fires first.
bool interruptible_sleep(std::chrono::milliseconds duration, const CancellationToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel.is_cancelled()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, CANCEL_POLL_INTERVAL));
    }
    return !cancel.is_cancelled();
}

VaultResult cancelled() {
    return VaultResult(VaultError::CANCELLED, "Operation cancelled");
}

// First failure wins; later ones are only logged.
class FailureSlot {
public:
    void set(const VaultResult& failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = failure;
        }
        failed_ = true;
    }
    bool failed() const { return failed_.load(); }
    std::optional<VaultResult> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<VaultResult> failure_;
    std::atomic<bool> failed_{false};
};

std::optional<std::chrono::system_clock::time_point> source_mtime(const std::filesystem::path& path) {
    std::error_code ec;
    auto file_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(file_time));
}

}

TransferOptions TransferOptions::for_upload(const storage::VaultConfig& config) {
    TransferOptions options;
    options.chunk_size = config.chunk_size;
    options.parallelism = config.parallel_uploads;
    options.max_retries = config.max_retries;
    options.retry_delay = config.retry_delay;
    options.chunk_timeout = config.chunk_timeout;
    options.encrypted = config.encryption;
    options.compressed = config.compression;
    options.kdf = config.kdf;
    return options;
}

TransferOptions TransferOptions::for_download(const storage::VaultConfig& config) {
    auto options = for_upload(config);
    options.parallelism = config.parallel_downloads;
    return options;
}

VaultResult TransferOptions::validate(uint64_t channel_max_blob_size) const {
    if (chunk_size == 0) {
        return VaultResult(VaultError::CONFIG_INVALID, "chunk_size must be positive");
    }
    auto sealed_size = crypto::ChunkPipeline::max_sealed_size(chunk_size, compressed, encrypted);
    if (sealed_size > channel_max_blob_size) {
        return VaultResult(VaultError::CHUNK_SIZE_EXCEEDS_LIMIT,
            "chunk_size " + std::to_string(chunk_size) + " seals to up to " + std::to_string(sealed_size) +
            " bytes, over the channel limit of " + std::to_string(channel_max_blob_size));
    }
    if (parallelism < 1) {
        return VaultResult(VaultError::CONFIG_INVALID, "parallelism must be at least 1");
    }
    if (max_retries < 0 || retry_delay.count() < 0 || chunk_timeout.count() <= 0) {
        return VaultResult(VaultError::CONFIG_INVALID, "invalid retry or timeout settings");
    }
    if (encrypted && !kdf.valid()) {
        return VaultResult(VaultError::CONFIG_INVALID, "invalid scrypt parameters");
    }
    return VaultResult();
}

struct TransferScheduler::UploadPlan {
    std::string name;
    uint64_t size = 0;
    int64_t mtime = 0;
    std::string content_hash;
    bool compressed = false;

    storage::TransferProgress progress;
    storage::CatalogIndex catalog;
    std::optional<crypto::SymmetricKey> key;
    bool resumed = false;
};

TransferScheduler::TransferScheduler(std::shared_ptr<remote::RemoteChannel> channel,
                                     std::shared_ptr<storage::CatalogManager> catalog,
                                     std::shared_ptr<storage::ResumeManager> resume,
                                     std::shared_ptr<ProgressStream> progress)
    : channel_(std::move(channel))
    , catalog_(std::move(catalog))
    , resume_(std::move(resume))
    , progress_(std::move(progress)) {
}

void TransferScheduler::publish(const ProgressEvent& event) {
    if (progress_) {
        progress_->publish(event);
    }
}

VaultResult TransferScheduler::with_retries(const TransferOptions& options,
                                            const CancellationToken& cancel,
                                            const std::function<VaultResult()>& operation,
                                            const ProgressEvent& context) {
    for (int attempt = 0;; ++attempt) {
        if (cancel.is_cancelled()) {
            return cancelled();
        }

        auto status = operation();
        if (status || !status.transient() || attempt >= options.max_retries) {
            return status;
        }

        auto factor = int64_t{1} << std::min(attempt, 16);
        std::chrono::milliseconds delay(options.retry_delay.count() * factor);
        delay = std::min(delay, MAX_BACKOFF);
        LOG_WARN("Chunk {} of {}: {} ({}), retry {}/{} in {}ms",
                 context.chunk_index, context.file_id, core::to_string(status.error), status.message,
                 attempt + 1, options.max_retries, delay.count());

        auto event = context;
        event.status = ChunkStatus::RETRYING;
        publish(event);

        if (!interruptible_sleep(delay, cancel)) {
            return cancelled();
        }
    }
}

VaultResult TransferScheduler::prepare_upload(const UploadRequest& request, UploadPlan& plan) {
    const auto& options = request.options;

    auto status = options.validate(channel_->max_blob_size());
    if (!status) {
        return status;
    }
    if (options.encrypted && request.password.empty()) {
        return VaultResult(VaultError::MISSING_CREDENTIALS,
            "Encryption is enabled but no password was given");
    }

    auto size = core::utils::FileUtils::file_size(request.source);
    auto mtime = core::utils::FileUtils::modification_time(request.source);
    if (!core::utils::FileUtils::is_file(request.source) || !size || !mtime) {
        return VaultResult(VaultError::IO_ERROR, "Cannot read " + request.source.string());
    }

    plan.name = request.name.empty() ? request.source.filename().string() : request.name;
    plan.size = *size;
    plan.mtime = *mtime;
    plan.compressed = options.compressed && crypto::Compressor::should_compress(plan.name);

    crypto::ContentHash digest;
    status = crypto::Blake2bHasher::hash_file(request.source, digest);
    if (!status) {
        return status;
    }
    plan.content_hash = crypto::hash_utils::hash_to_hex(digest);

    // First remote operation: everything above fails without touching the channel.
    return catalog_->read(plan.catalog);
}

std::optional<storage::TransferProgress> TransferScheduler::find_resumable(const UploadRequest& request,
                                                                           const UploadPlan& plan) {
    if (!resume_ || !request.resume) {
        return std::nullopt;
    }
    auto stored = resume_->load_progress(request.source);
    if (!stored) {
        return std::nullopt;
    }

    const auto& options = request.options;
    std::string reason;
    if (stored->source_size != plan.size || stored->source_mtime != plan.mtime ||
        stored->content_hash != plan.content_hash) {
        reason = "source changed";
    } else if (stored->chunk_size != options.chunk_size) {
        reason = "chunk size changed";
    } else if (stored->encrypted != options.encrypted || stored->compressed != plan.compressed) {
        reason = "pipeline settings changed";
    } else if (stored->encrypted && (!stored->kdf_salt || !(stored->kdf == options.kdf))) {
        reason = "key derivation settings changed";
    } else if (plan.catalog.is_taken(stored->file_id)) {
        reason = "file id already in catalog";
    } else {
        for (const auto& [index, chunk] : stored->completed) {
            if (index != chunk.index || (stored->encrypted && !chunk.nonce)) {
                reason = "inconsistent chunk entries";
                break;
            }
        }
    }

    if (!reason.empty()) {
        LOG_WARN("Discarding progress for {} ({})", request.source.string(), reason);
        resume_->remove_progress(stored->file_id);
        return std::nullopt;
    }
    return stored;
}

VaultResult TransferScheduler::start_fresh(const UploadRequest& request, UploadPlan& plan) {
    const auto& options = request.options;
    auto& progress = plan.progress;

    do {
        progress.file_id = crypto::SecureRandom::generate_hex_id(6);
    } while (plan.catalog.is_taken(progress.file_id));

    progress.source_path = storage::ResumeManager::normalize_path(request.source);
    progress.source_size = plan.size;
    progress.source_mtime = plan.mtime;
    progress.content_hash = plan.content_hash;
    progress.chunk_size = options.chunk_size;
    progress.encrypted = options.encrypted;
    progress.compressed = plan.compressed;
    progress.kdf = options.kdf;

    VaultResult status;
    if (options.encrypted) {
        progress.kdf_salt = crypto::SecureRandom::generate_salt();
        crypto::SymmetricKey key;
        status = crypto::KeyDerivation::derive_key(request.password, *progress.kdf_salt, options.kdf, key);
        if (!status) {
            return status;
        }
        progress.key_check = crypto::KeyDerivation::key_check(key);
        plan.key = key;
    }

    nlohmann::json anchor = {
        {"televault", "anchor"},
        {"id", progress.file_id},
        {"name", plan.name},
        {"created_at", TimeUtils::to_unix_seconds(TimeUtils::now())},
    };
    auto anchor_bytes = anchor.dump();

    ProgressEvent context;
    context.file_id = progress.file_id;
    status = with_retries(options, CancellationToken{}, [&] {
        return channel_->put_blob(crypto::as_bytes(anchor_bytes), std::nullopt, progress.anchor_ref);
    }, context);
    if (!status) {
        return VaultResult(VaultError::UPLOAD_FAILED, "Could not create anchor: " + status.message)
            .caused_by(status.error);
    }

    if (resume_ && !resume_->save_progress(progress)) {
        LOG_WARN("Could not persist progress for {}, continuing without resume support", progress.file_id);
    }
    return VaultResult();
}

VaultResult TransferScheduler::upload(const UploadRequest& request,
                                      const CancellationToken& cancel,
                                      UploadOutcome& out) {
    const auto& options = request.options;
    UploadPlan plan;

    auto status = prepare_upload(request, plan);
    if (!status) {
        return status.in_operation("push");
    }

    channel_->set_timeout(options.chunk_timeout);

    if (auto stored = find_resumable(request, plan)) {
        if (stored->encrypted) {
            crypto::SymmetricKey key;
            status = crypto::KeyDerivation::derive_key(request.password, *stored->kdf_salt, stored->kdf, key);
            if (!status) {
                return status.in_operation("push");
            }
            if (crypto::KeyDerivation::key_check(key) == stored->key_check) {
                plan.key = key;
                plan.progress = std::move(*stored);
                plan.resumed = true;
            } else {
                LOG_WARN("Discarding progress for {} (different password)", request.source.string());
                resume_->remove_progress(stored->file_id);
            }
        } else {
            plan.progress = std::move(*stored);
            plan.resumed = true;
        }
    }

    if (plan.resumed) {
        LOG_INFO("Resuming upload of {} as {} ({} chunks already stored)",
                 plan.name, plan.progress.file_id, plan.progress.completed.size());
    } else {
        status = start_fresh(request, plan);
        if (!status) {
            return status.in_operation("push").for_file(plan.progress.file_id);
        }
        LOG_INFO("Uploading {} as {} ({})", plan.name, plan.progress.file_id,
                 core::utils::StringUtils::format_bytes(plan.size));
    }

    const std::string file_id = plan.progress.file_id;
    auto fail = [&](VaultResult result) {
        return result.in_operation("push").for_file(file_id);
    };

    crypto::PipelineSettings settings;
    settings.compress = plan.compressed;
    settings.encrypt = options.encrypted;
    crypto::ChunkPipeline pipeline(settings, plan.key);
    status = pipeline.validate();
    if (!status) {
        return fail(status);
    }

    storage::ChunkReader reader(request.source, options.chunk_size);
    status = reader.open();
    if (!status) {
        return fail(status);
    }
    const auto& layout = reader.layout();
    if (layout.file_size() != plan.size) {
        return fail(VaultResult(VaultError::SIZE_MISMATCH, "Source changed size while uploading"));
    }

    std::vector<uint64_t> pending;
    for (uint64_t i = 0; i < layout.chunk_count(); ++i) {
        if (plan.progress.completed.count(i) == 0) {
            pending.push_back(i);
        }
    }

    std::mutex results_mutex;
    std::map<uint64_t, storage::ChunkRef> results = plan.progress.completed;
    std::atomic<uint64_t> chunks_done{results.size()};
    std::atomic<uint64_t> bytes_done{0};
    for (const auto& [index, chunk] : results) {
        bytes_done += chunk.plain_size;
        ProgressEvent skipped;
        skipped.direction = TransferDirection::UPLOAD;
        skipped.file_id = file_id;
        skipped.chunk_index = index;
        skipped.status = ChunkStatus::SKIPPED;
        skipped.total_bytes = plan.size;
        skipped.total_chunks = layout.chunk_count();
        publish(skipped);
    }

    FailureSlot failure;
    std::atomic<size_t> cursor{0};
    const auto anchor = plan.progress.anchor_ref;

    auto worker = [&] {
        std::vector<uint8_t> plaintext;
        crypto::SealedChunk sealed;
        while (!failure.failed() && !cancel.is_cancelled()) {
            size_t slot = cursor.fetch_add(1);
            if (slot >= pending.size()) {
                break;
            }
            uint64_t index = pending[slot];

            ProgressEvent event;
            event.direction = TransferDirection::UPLOAD;
            event.file_id = file_id;
            event.chunk_index = index;
            event.status = ChunkStatus::STARTED;
            event.total_bytes = plan.size;
            event.total_chunks = layout.chunk_count();
            publish(event);

            auto result = reader.read(index, plaintext);
            if (result) {
                result = pipeline.seal(file_id, index, plaintext, sealed);
            }
            if (!result) {
                failure.set(result.at_chunk(index));
                break;
            }

            remote::RemoteRef ref;
            result = with_retries(options, cancel, [&] {
                return channel_->put_blob(sealed.blob, anchor, ref);
            }, event);
            if (!result) {
                if (result.error != VaultError::CANCELLED) {
                    event.status = ChunkStatus::FAILED;
                    publish(event);
                    failure.set(VaultResult(VaultError::UPLOAD_FAILED, result.message)
                        .at_chunk(index).caused_by(result.error));
                }
                break;
            }

            auto chunk = storage::ChunkRef::from_sealed(index, ref, sealed);
            if (resume_) {
                resume_->record_chunk(file_id, chunk);
            }
            {
                std::lock_guard<std::mutex> lock(results_mutex);
                results.emplace(index, std::move(chunk));
            }

            LOG_DEBUG("Chunk {}/{} of {} stored as {} ({} bytes)",
                      index + 1, layout.chunk_count(), file_id, ref, sealed.blob.size());
            event.status = ChunkStatus::COMPLETED;
            event.chunks_done = ++chunks_done;
            event.bytes_transferred = (bytes_done += plaintext.size());
            publish(event);
        }
    };

    if (!pending.empty()) {
        size_t workers = std::min<size_t>(static_cast<size_t>(options.parallelism), pending.size());
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < workers; ++i) {
            boost::asio::post(pool, worker);
        }
        pool.join();
    }

    if (auto first = failure.get()) {
        LOG_ERROR("Upload of {} failed: {}", file_id, first->message);
        return fail(*first);
    }
    if (cancel.is_cancelled()) {
        LOG_INFO("Upload of {} cancelled after {} of {} chunks", file_id, results.size(), layout.chunk_count());
        return fail(cancelled());
    }

    storage::FileRecord record;
    record.file_id = file_id;
    record.name = plan.name;
    record.size = plan.size;
    record.chunk_size = options.chunk_size;
    for (auto& [index, chunk] : results) {
        record.chunk_refs.push_back(chunk);
    }
    record.content_hash = plan.content_hash;
    record.encrypted = options.encrypted;
    record.compressed = plan.compressed;
    record.kdf_salt = plan.progress.kdf_salt;
    record.kdf = plan.progress.kdf;
    record.created_at = TimeUtils::now();
    record.modified_at = source_mtime(request.source);
    record.anchor_ref = anchor;
    record.mime_type = storage::guess_mime_type(plan.name);

    status = record.validate();
    if (!status) {
        return fail(status);
    }

    auto record_bytes = record.serialize();
    remote::RemoteRef record_ref;
    ProgressEvent context;
    context.file_id = file_id;
    status = with_retries(options, cancel, [&] {
        return channel_->put_blob(crypto::as_bytes(record_bytes), anchor, record_ref);
    }, context);
    if (!status) {
        if (status.error == VaultError::CANCELLED) {
            return fail(status);
        }
        return fail(VaultResult(VaultError::UPLOAD_FAILED, "Could not store file record: " + status.message)
            .caused_by(status.error));
    }

    status = catalog_->link_file(file_id, record_ref);
    if (!status) {
        return fail(status);
    }

    if (resume_) {
        resume_->remove_progress(file_id);
    }

    LOG_INFO("Uploaded {} as {}: {} chunks ({} new, {} resumed), {} stored",
             plan.name, file_id, record.chunk_count(), pending.size(), plan.progress.completed.size(),
             core::utils::StringUtils::format_bytes(record.stored_size()));

    out.record = std::move(record);
    out.record_ref = record_ref;
    out.chunks_uploaded = pending.size();
    out.chunks_skipped = plan.progress.completed.size();
    out.resumed = plan.resumed;
    return VaultResult();
}

VaultResult TransferScheduler::download(const DownloadRequest& request, const CancellationToken& cancel) {
    const auto& record = request.record;
    const auto& options = request.options;
    auto fail = [&](VaultResult result) {
        return result.in_operation("pull").for_file(record.file_id);
    };

    auto status = record.validate();
    if (!status) {
        return fail(status);
    }
    if (options.parallelism < 1) {
        return fail(VaultResult(VaultError::CONFIG_INVALID, "parallelism must be at least 1"));
    }

    std::optional<crypto::SymmetricKey> key;
    if (record.encrypted) {
        if (request.password.empty()) {
            return fail(VaultResult(VaultError::MISSING_CREDENTIALS, "File is encrypted but no password was given"));
        }
        crypto::SymmetricKey derived;
        status = crypto::KeyDerivation::derive_key(request.password, *record.kdf_salt, record.kdf, derived);
        if (!status) {
            return fail(status);
        }
        key = derived;
    }

    crypto::PipelineSettings settings;
    settings.compress = record.compressed;
    settings.encrypt = record.encrypted;
    crypto::ChunkPipeline pipeline(settings, key);
    status = pipeline.validate();
    if (!status) {
        return fail(status);
    }

    channel_->set_timeout(options.chunk_timeout);

    auto part_path = request.output;
    part_path += ".part";
    if (request.output.has_parent_path()) {
        core::utils::FileUtils::create_directories(request.output.parent_path());
    }
    std::ofstream output(part_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return fail(VaultResult(VaultError::IO_ERROR, "Cannot create " + part_path.string()));
    }
    auto discard_partial = [&] {
        output.close();
        std::error_code ec;
        std::filesystem::remove(part_path, ec);
    };

    crypto::Blake2bHasher hasher;
    status = hasher.initialize();
    if (!status) {
        discard_partial();
        return fail(status);
    }

    const auto layout = record.layout();
    storage::Reassembler reassembler(layout, [&](std::span<const uint8_t> data) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output.good()) {
            return VaultResult(VaultError::IO_ERROR, "Write to " + part_path.string() + " failed");
        }
        return hasher.update(data);
    });

    LOG_INFO("Downloading {} ({}, {} chunks)", record.name,
             core::utils::StringUtils::format_bytes(record.size), layout.chunk_count());

    const uint64_t window = 2 * static_cast<uint64_t>(options.parallelism);
    std::mutex state_mutex;
    std::condition_variable state_cv;
    FailureSlot failure;
    std::atomic<uint64_t> cursor{0};
    std::atomic<uint64_t> chunks_done{0};
    std::atomic<uint64_t> bytes_done{0};

    auto stop = [&](const VaultResult& result) {
        failure.set(result);
        state_cv.notify_all();
    };

    auto worker = [&] {
        std::vector<uint8_t> blob;
        while (!failure.failed() && !cancel.is_cancelled()) {
            uint64_t index = cursor.fetch_add(1);
            if (index >= layout.chunk_count()) {
                break;
            }

            // Stay within the window ahead of the next chunk to be written.
            {
                std::unique_lock<std::mutex> lock(state_mutex);
                while (index >= reassembler.next_index() + window &&
                       !failure.failed() && !cancel.is_cancelled()) {
                    state_cv.wait_for(lock, CANCEL_POLL_INTERVAL);
                }
            }
            if (failure.failed() || cancel.is_cancelled()) {
                break;
            }

            const auto& chunk = record.chunk_refs[index];
            ProgressEvent event;
            event.direction = TransferDirection::DOWNLOAD;
            event.file_id = record.file_id;
            event.chunk_index = index;
            event.status = ChunkStatus::STARTED;
            event.total_bytes = record.size;
            event.total_chunks = layout.chunk_count();
            publish(event);

            auto result = with_retries(options, cancel, [&] {
                return channel_->get_blob(chunk.remote_ref, blob);
            }, event);
            if (!result) {
                if (result.error == VaultError::CANCELLED) {
                    break;
                }
                event.status = ChunkStatus::FAILED;
                publish(event);
                auto reason = result.error == VaultError::NOT_FOUND ?
                    "Chunk blob " + chunk.remote_ref + " is gone" :
                    "Chunk blob " + chunk.remote_ref + " could not be fetched: " + result.message;
                stop(VaultResult(VaultError::CHUNK_MISSING, reason).at_chunk(index).caused_by(result.error));
                break;
            }

            std::vector<uint8_t> plaintext;
            result = pipeline.open(record.file_id, index, chunk.seal(), blob, plaintext);
            if (!result) {
                event.status = ChunkStatus::FAILED;
                publish(event);
                stop(result.at_chunk(index));
                break;
            }

            auto plain_size = plaintext.size();
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                result = reassembler.add(index, std::move(plaintext));
            }
            state_cv.notify_all();
            if (!result) {
                stop(result);
                break;
            }

            LOG_DEBUG("Chunk {}/{} of {} decoded ({} bytes)", index + 1, layout.chunk_count(),
                      record.file_id, plain_size);
            event.status = ChunkStatus::COMPLETED;
            event.chunks_done = ++chunks_done;
            event.bytes_transferred = (bytes_done += plain_size);
            publish(event);
        }
    };

    if (layout.chunk_count() > 0) {
        size_t workers = std::min<size_t>(static_cast<size_t>(options.parallelism), layout.chunk_count());
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < workers; ++i) {
            boost::asio::post(pool, worker);
        }
        pool.join();
    }

    if (auto first = failure.get()) {
        discard_partial();
        LOG_ERROR("Download of {} failed: {} ({})", record.file_id,
                  core::to_string(first->error), first->message);
        return fail(*first);
    }
    if (cancel.is_cancelled()) {
        discard_partial();
        return fail(cancelled());
    }

    status = reassembler.finish();
    if (!status) {
        discard_partial();
        return fail(status);
    }

    output.flush();
    output.close();
    if (output.fail()) {
        discard_partial();
        return fail(VaultResult(VaultError::IO_ERROR, "Could not finish writing " + part_path.string()));
    }

    crypto::ContentHash digest;
    status = hasher.finalize(digest);
    if (!status) {
        discard_partial();
        return fail(status);
    }
    if (crypto::hash_utils::hash_to_hex(digest) != record.content_hash) {
        discard_partial();
        return fail(VaultResult(VaultError::TAMPERED_OR_CORRUPT,
            "Downloaded content does not match the recorded hash"));
    }

    std::error_code ec;
    std::filesystem::rename(part_path, request.output, ec);
    if (ec) {
        discard_partial();
        return fail(VaultResult(VaultError::IO_ERROR,
            "Cannot move " + part_path.string() + " into place: " + ec.message()));
    }

    LOG_INFO("Downloaded {} to {}", record.file_id, request.output.string());
    return VaultResult();
}

VaultResult TransferScheduler::remove(const std::string& file_id) {
    remote::RemoteRef record_ref;
    auto status = catalog_->unlink_file(file_id, &record_ref);
    if (!status) {
        return status.in_operation("rm").for_file(file_id);
    }

    // Everything past this point only reclaims space.
    storage::FileRecord record;
    status = catalog_->fetch_record(record_ref, record);
    if (!status) {
        LOG_WARN("Removed {} from catalog but could not read its record for cleanup: {}",
                 file_id, status.message);
        return VaultResult();
    }

    std::vector<remote::RemoteRef> refs;
    if (!record.anchor_ref.empty()) {
        status = channel_->list_replies(record.anchor_ref, refs);
        if (!status) {
            LOG_WARN("Could not list blobs of {}: {}", file_id, status.message);
        }
        refs.push_back(record.anchor_ref);
    }
    for (const auto& chunk : record.chunk_refs) {
        if (std::find(refs.begin(), refs.end(), chunk.remote_ref) == refs.end()) {
            refs.push_back(chunk.remote_ref);
        }
    }
    if (std::find(refs.begin(), refs.end(), record_ref) == refs.end()) {
        refs.push_back(record_ref);
    }

    status = channel_->delete_blobs(refs);
    if (!status) {
        LOG_WARN("Blob cleanup for {} incomplete ({}): {}", file_id,
                 core::to_string(status.error), status.message);
    } else {
        LOG_DEBUG("Deleted {} blobs of {}", refs.size(), file_id);
    }
    return VaultResult();
}

} // namespace televault::transfer
