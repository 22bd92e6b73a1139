#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mock_remote_channel.hpp"
#include "televault/crypto/encryption.hpp"
#include "televault/transfer/transfer_scheduler.hpp"
#include <filesystem>
#include <fstream>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <thread>

using namespace televault;
using namespace televault::transfer;
using core::VaultError;
using core::VaultResult;
using remote::RemoteRef;
using test::MockRemoteChannel;
using ::testing::_;
using ::testing::NiceMock;

namespace {

constexpr uint64_t KiB = 1024;

std::vector<uint8_t> random_bytes(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(rng());
    }
    return data;
}

std::vector<uint8_t> text_bytes(size_t size) {
    const std::string line = "televault stores files as encrypted chunks in a message channel\n";
    std::vector<uint8_t> data;
    data.reserve(size);
    while (data.size() < size) {
        data.push_back(static_cast<uint8_t>(line[data.size() % line.size()]));
    }
    return data;
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}

class TransferSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!crypto::EncryptionEngine::is_available()) {
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
        }
        test_dir_ = std::filesystem::temp_directory_path() / "televault_scheduler_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        channel_ = std::make_shared<NiceMock<MockRemoteChannel>>();
        catalog_ = std::make_shared<storage::CatalogManager>(
            channel_, storage::CatalogManager::DEFAULT_SLOT, 8, std::chrono::milliseconds(1));
        resume_ = std::make_shared<storage::ResumeManager>(test_dir_ / "progress.db");
        ASSERT_TRUE(resume_->initialize());
        progress_ = std::make_shared<ProgressStream>(4096);
        scheduler_ = std::make_unique<TransferScheduler>(channel_, catalog_, resume_, progress_);
    }

    void TearDown() override {
        scheduler_.reset();
        resume_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    TransferOptions options() const {
        TransferOptions opts;
        opts.chunk_size = 100 * KiB;
        opts.parallelism = 3;
        opts.max_retries = 3;
        opts.retry_delay = std::chrono::milliseconds(1);
        opts.kdf.n = 1024;
        return opts;
    }

    std::filesystem::path write_source(const std::string& name, const std::vector<uint8_t>& data) {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return path;
    }

    UploadRequest upload_request(const std::filesystem::path& source) const {
        UploadRequest request;
        request.source = source;
        request.password = "correct horse";
        request.options = options();
        return request;
    }

    DownloadRequest download_request(const storage::FileRecord& record, const std::string& output) const {
        DownloadRequest request;
        request.record = record;
        request.output = test_dir_ / output;
        request.password = "correct horse";
        request.options = options();
        return request;
    }

    // Routes chunk puts (replies to the anchor) through `hook`; everything
    // else reaches the backing channel.
    template <typename Hook>
    void intercept_chunk_puts(Hook hook) {
        ON_CALL(*channel_, put_blob(_, _, _))
            .WillByDefault([this, hook](std::span<const uint8_t> data, const std::optional<RemoteRef>& reply_to,
                                        RemoteRef& out_ref) -> VaultResult {
                if (reply_to) {
                    auto injected = hook();
                    if (!injected) {
                        return injected;
                    }
                }
                return channel_->backing().put_blob(data, reply_to, out_ref);
            });
    }

    // Routes fetches of the record's chunks through `hook(index)`.
    template <typename Hook>
    void intercept_chunk_gets(const storage::FileRecord& record, Hook hook) {
        std::map<RemoteRef, uint64_t> indices;
        for (uint64_t i = 0; i < record.chunk_refs.size(); ++i) {
            indices[record.chunk_refs[i].remote_ref] = i;
        }
        ON_CALL(*channel_, get_blob(_, _))
            .WillByDefault([this, indices, hook](const RemoteRef& ref, std::vector<uint8_t>& out_data) -> VaultResult {
                if (auto it = indices.find(ref); it != indices.end()) {
                    auto injected = hook(it->second);
                    if (!injected) {
                        return injected;
                    }
                }
                return channel_->backing().get_blob(ref, out_data);
            });
    }

    size_t count_events(ChunkStatus status) {
        size_t count = 0;
        for (const auto& event : progress_->drain()) {
            count += event.status == status ? 1 : 0;
        }
        return count;
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<NiceMock<MockRemoteChannel>> channel_;
    std::shared_ptr<storage::CatalogManager> catalog_;
    std::shared_ptr<storage::ResumeManager> resume_;
    std::shared_ptr<ProgressStream> progress_;
    std::unique_ptr<TransferScheduler> scheduler_;
    CancellationToken cancel_;
};

TEST_F(TransferSchedulerTest, UploadThenDownloadRestoresBytes) {
    auto data = random_bytes(250 * KiB, 1);
    auto source = write_source("archive.bin", data);

    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    const auto& record = outcome.record;
    EXPECT_EQ(record.name, "archive.bin");
    EXPECT_EQ(record.size, data.size());
    ASSERT_EQ(record.chunk_count(), 3u);
    EXPECT_EQ(record.chunk_refs[0].plain_size, 100 * KiB);
    EXPECT_EQ(record.chunk_refs[2].plain_size, 50 * KiB);
    EXPECT_TRUE(record.encrypted);
    EXPECT_TRUE(record.kdf_salt.has_value());
    EXPECT_EQ(outcome.chunks_uploaded, 3u);
    EXPECT_FALSE(outcome.resumed);

    RemoteRef linked;
    ASSERT_TRUE(catalog_->lookup(record.file_id, linked));
    EXPECT_EQ(linked, outcome.record_ref);
    EXPECT_EQ(resume_->get_progress_count(), 0u);

    ASSERT_TRUE(scheduler_->download(download_request(record, "restored.bin"), cancel_));
    EXPECT_EQ(read_file(test_dir_ / "restored.bin"), data);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "restored.bin.part"));
}

TEST_F(TransferSchedulerTest, ProgressCoversEveryChunk) {
    auto source = write_source("archive.bin", random_bytes(250 * KiB, 2));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    uint64_t max_done = 0;
    size_t completed = 0;
    for (const auto& event : progress_->drain()) {
        EXPECT_EQ(event.file_id, outcome.record.file_id);
        EXPECT_EQ(event.total_chunks, 3u);
        if (event.status == ChunkStatus::COMPLETED) {
            ++completed;
            max_done = std::max(max_done, event.chunks_done);
        }
    }
    EXPECT_EQ(completed, 3u);
    EXPECT_EQ(max_done, 3u);
}

TEST_F(TransferSchedulerTest, CompressibleDataShrinks) {
    auto data = text_bytes(250 * KiB);
    auto source = write_source("notes.txt", data);

    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    EXPECT_TRUE(outcome.record.compressed);
    EXPECT_LT(outcome.record.stored_size(), outcome.record.size);

    ASSERT_TRUE(scheduler_->download(download_request(outcome.record, "notes.out"), cancel_));
    EXPECT_EQ(read_file(test_dir_ / "notes.out"), data);
}

TEST_F(TransferSchedulerTest, AlreadyCompressedFormatsAreStoredAsIs) {
    auto source = write_source("bundle.zip", text_bytes(10 * KiB));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    EXPECT_FALSE(outcome.record.compressed);
}

TEST_F(TransferSchedulerTest, UnencryptedUploadNeedsNoPassword) {
    auto data = random_bytes(120 * KiB, 3);
    auto source = write_source("plain.bin", data);

    auto request = upload_request(source);
    request.password.clear();
    request.options.encrypted = false;
    request.options.compressed = false;

    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(request, cancel_, outcome));
    EXPECT_FALSE(outcome.record.encrypted);
    EXPECT_FALSE(outcome.record.kdf_salt.has_value());

    auto download = download_request(outcome.record, "plain.out");
    download.password.clear();
    ASSERT_TRUE(scheduler_->download(download, cancel_));
    EXPECT_EQ(read_file(test_dir_ / "plain.out"), data);
}

TEST_F(TransferSchedulerTest, EmptyFileHasNoChunks) {
    auto source = write_source("empty.dat", {});
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    EXPECT_EQ(outcome.record.chunk_count(), 0u);
    EXPECT_EQ(outcome.record.size, 0u);

    ASSERT_TRUE(scheduler_->download(download_request(outcome.record, "empty.out"), cancel_));
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "empty.out"));
    EXPECT_EQ(std::filesystem::file_size(test_dir_ / "empty.out"), 0u);
}

TEST_F(TransferSchedulerTest, TransientChunkFailureIsRetried) {
    auto data = random_bytes(500 * KiB, 4);
    auto source = write_source("flaky.bin", data);

    // Chunk puts run in index order with one worker: calls 3 and 4 are the
    // first attempt and first retry of chunk 2, which lands on the second retry.
    auto chunk_puts = std::make_shared<std::atomic<int>>(0);
    intercept_chunk_puts([chunk_puts] {
        int call = ++(*chunk_puts);
        if (call == 3 || call == 4) {
            return VaultResult(VaultError::TRANSIENT, "flood wait");
        }
        return VaultResult();
    });

    auto request = upload_request(source);
    request.options.parallelism = 1;
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(request, cancel_, outcome));
    EXPECT_EQ(outcome.record.chunk_count(), 5u);
    EXPECT_EQ(chunk_puts->load(), 7);

    std::vector<uint64_t> retried;
    for (const auto& event : progress_->drain()) {
        if (event.status == ChunkStatus::RETRYING) {
            retried.push_back(event.chunk_index);
        }
    }
    EXPECT_EQ(retried, (std::vector<uint64_t>{2, 2}));

    ASSERT_TRUE(scheduler_->download(download_request(outcome.record, "flaky.out"), cancel_));
    EXPECT_EQ(read_file(test_dir_ / "flaky.out"), data);
}

TEST_F(TransferSchedulerTest, ExhaustedRetriesFailTheUpload) {
    auto source = write_source("doomed.bin", random_bytes(250 * KiB, 5));
    intercept_chunk_puts([] { return VaultResult(VaultError::TIMEOUT, "no answer"); });

    auto request = upload_request(source);
    request.options.max_retries = 2;
    UploadOutcome outcome;
    auto status = scheduler_->upload(request, cancel_, outcome);

    EXPECT_EQ(status.error, VaultError::UPLOAD_FAILED);
    EXPECT_EQ(status.cause, VaultError::TIMEOUT);
    EXPECT_TRUE(status.chunk_index.has_value());
    EXPECT_EQ(status.operation, "push");

    storage::CatalogIndex index;
    ASSERT_TRUE(catalog_->read(index));
    EXPECT_TRUE(index.files.empty());
    EXPECT_EQ(resume_->get_progress_count(), 1u);
}

TEST_F(TransferSchedulerTest, InterruptedUploadResumes) {
    auto data = random_bytes(500 * KiB, 6);
    auto source = write_source("big.bin", data);

    auto chunk_puts = std::make_shared<std::atomic<int>>(0);
    auto broken = std::make_shared<std::atomic<bool>>(true);
    intercept_chunk_puts([chunk_puts, broken] {
        if (*broken && ++(*chunk_puts) == 3) {
            return VaultResult(VaultError::IO_ERROR, "connection reset");
        }
        return VaultResult();
    });

    auto request = upload_request(source);
    request.options.parallelism = 1;
    UploadOutcome first;
    EXPECT_EQ(scheduler_->upload(request, cancel_, first).error, VaultError::UPLOAD_FAILED);

    auto stored = resume_->load_progress(source);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->completed_indices(), (std::set<uint64_t>{0, 1}));

    *broken = false;
    UploadOutcome second;
    ASSERT_TRUE(scheduler_->upload(request, cancel_, second));
    EXPECT_TRUE(second.resumed);
    EXPECT_EQ(second.record.file_id, stored->file_id);
    EXPECT_EQ(second.chunks_skipped, 2u);
    EXPECT_EQ(second.chunks_uploaded, 3u);
    EXPECT_EQ(resume_->get_progress_count(), 0u);

    ASSERT_TRUE(scheduler_->download(download_request(second.record, "big.out"), cancel_));
    EXPECT_EQ(read_file(test_dir_ / "big.out"), data);
}

TEST_F(TransferSchedulerTest, ChangedSourceStartsOver) {
    auto source = write_source("moving.bin", random_bytes(300 * KiB, 7));
    intercept_chunk_puts([] { return VaultResult(VaultError::IO_ERROR, "connection reset"); });

    UploadOutcome first;
    EXPECT_FALSE(scheduler_->upload(upload_request(source), cancel_, first));
    auto stale = resume_->load_progress(source);
    ASSERT_TRUE(stale.has_value());

    intercept_chunk_puts([] { return VaultResult(); });
    write_source("moving.bin", random_bytes(310 * KiB, 8));

    UploadOutcome second;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, second));
    EXPECT_FALSE(second.resumed);
    EXPECT_NE(second.record.file_id, stale->file_id);
}

TEST_F(TransferSchedulerTest, DifferentPasswordStartsOver) {
    auto source = write_source("secret.bin", random_bytes(300 * KiB, 9));
    intercept_chunk_puts([] { return VaultResult(VaultError::IO_ERROR, "connection reset"); });

    UploadOutcome first;
    EXPECT_FALSE(scheduler_->upload(upload_request(source), cancel_, first));

    intercept_chunk_puts([] { return VaultResult(); });
    auto request = upload_request(source);
    request.password = "another password";
    UploadOutcome second;
    ASSERT_TRUE(scheduler_->upload(request, cancel_, second));
    EXPECT_FALSE(second.resumed);
}

TEST_F(TransferSchedulerTest, CancelStopsUploadAndKeepsProgress) {
    auto source = write_source("long.bin", random_bytes(500 * KiB, 10));
    auto chunk_puts = std::make_shared<std::atomic<int>>(0);
    intercept_chunk_puts([this, chunk_puts] {
        if (++(*chunk_puts) == 2) {
            cancel_.cancel();
        }
        return VaultResult();
    });

    auto request = upload_request(source);
    request.options.parallelism = 1;
    UploadOutcome outcome;
    EXPECT_EQ(scheduler_->upload(request, cancel_, outcome).error, VaultError::CANCELLED);

    storage::CatalogIndex index;
    ASSERT_TRUE(catalog_->read(index));
    EXPECT_TRUE(index.files.empty());
    EXPECT_EQ(resume_->get_progress_count(), 1u);
}

TEST_F(TransferSchedulerTest, CancelledDownloadLeavesNothingBehind) {
    auto source = write_source("archive.bin", random_bytes(250 * KiB, 11));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    cancel_.cancel();
    EXPECT_EQ(scheduler_->download(download_request(outcome.record, "never.bin"), cancel_).error,
              VaultError::CANCELLED);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "never.bin"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "never.bin.part"));
}

TEST_F(TransferSchedulerTest, TamperedChunkIsDetected) {
    auto source = write_source("archive.bin", random_bytes(250 * KiB, 12));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    ASSERT_TRUE(channel_->backing().corrupt_blob(outcome.record.chunk_refs[1].remote_ref, 17));

    auto status = scheduler_->download(download_request(outcome.record, "tampered.bin"), cancel_);
    EXPECT_EQ(status.error, VaultError::TAMPERED_OR_CORRUPT);
    EXPECT_EQ(status.chunk_index.value_or(99), 1u);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "tampered.bin"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "tampered.bin.part"));
}

TEST_F(TransferSchedulerTest, WrongPasswordFailsDecryption) {
    auto source = write_source("archive.bin", random_bytes(150 * KiB, 13));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    auto request = download_request(outcome.record, "wrong.bin");
    request.password = "not it";
    EXPECT_EQ(scheduler_->download(request, cancel_).error, VaultError::DECRYPTION_FAILED);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "wrong.bin"));

    request.password.clear();
    EXPECT_EQ(scheduler_->download(request, cancel_).error, VaultError::MISSING_CREDENTIALS);
}

TEST_F(TransferSchedulerTest, DeletedChunkIsReportedMissing) {
    auto source = write_source("archive.bin", random_bytes(250 * KiB, 14));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    ASSERT_TRUE(channel_->backing().delete_blobs({outcome.record.chunk_refs[2].remote_ref}));

    auto status = scheduler_->download(download_request(outcome.record, "holey.bin"), cancel_);
    EXPECT_EQ(status.error, VaultError::CHUNK_MISSING);
    EXPECT_EQ(status.cause, VaultError::NOT_FOUND);
}

TEST_F(TransferSchedulerTest, TransientFetchFailureIsRetried) {
    auto data = random_bytes(500 * KiB, 20);
    auto source = write_source("flaky_pull.bin", data);
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    progress_->drain();

    auto fetches_of_two = std::make_shared<std::atomic<int>>(0);
    intercept_chunk_gets(outcome.record, [fetches_of_two](uint64_t index) {
        if (index == 2 && ++(*fetches_of_two) <= 2) {
            return VaultResult(VaultError::TIMEOUT, "no answer");
        }
        return VaultResult();
    });

    ASSERT_TRUE(scheduler_->download(download_request(outcome.record, "flaky_pull.out"), cancel_));
    EXPECT_EQ(read_file(test_dir_ / "flaky_pull.out"), data);
    EXPECT_EQ(fetches_of_two->load(), 3);

    size_t retries = 0;
    for (const auto& event : progress_->drain()) {
        if (event.status == ChunkStatus::RETRYING) {
            EXPECT_EQ(event.direction, TransferDirection::DOWNLOAD);
            EXPECT_EQ(event.chunk_index, 2u);
            ++retries;
        }
    }
    EXPECT_EQ(retries, 2u);
}

TEST_F(TransferSchedulerTest, ExhaustedFetchRetriesFailThePull) {
    auto source = write_source("unreachable.bin", random_bytes(250 * KiB, 21));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    auto fetches_of_one = std::make_shared<std::atomic<int>>(0);
    intercept_chunk_gets(outcome.record, [fetches_of_one](uint64_t index) {
        if (index == 1) {
            ++(*fetches_of_one);
            return VaultResult(VaultError::TRANSIENT, "flood wait");
        }
        return VaultResult();
    });

    auto request = download_request(outcome.record, "unreachable.out");
    request.options.max_retries = 2;
    auto status = scheduler_->download(request, cancel_);

    EXPECT_EQ(status.error, VaultError::CHUNK_MISSING);
    EXPECT_EQ(status.cause, VaultError::TRANSIENT);
    ASSERT_TRUE(status.chunk_index.has_value());
    EXPECT_EQ(*status.chunk_index, 1u);
    EXPECT_EQ(status.operation, "pull");
    EXPECT_EQ(status.file_id, outcome.record.file_id);
    EXPECT_EQ(fetches_of_one->load(), 3);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "unreachable.out"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "unreachable.out.part"));
}

TEST_F(TransferSchedulerTest, FetchesStayWithinReadAheadWindow) {
    auto data = random_bytes(1000 * KiB, 22);
    auto source = write_source("windowed.bin", data);
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    ASSERT_EQ(outcome.record.chunk_count(), 10u);

    // Chunk 0 is held back, so nothing can be written; with two workers no
    // fetch may run more than four indices ahead of it.
    struct FetchLog {
        std::mutex mutex;
        std::condition_variable changed;
        std::set<uint64_t> seen;
        bool released_first = false;
        uint64_t furthest_before_release = 0;
    };
    auto log = std::make_shared<FetchLog>();
    intercept_chunk_gets(outcome.record, [log](uint64_t index) {
        std::unique_lock<std::mutex> lock(log->mutex);
        log->seen.insert(index);
        if (!log->released_first) {
            log->furthest_before_release = std::max(log->furthest_before_release, index);
        }
        log->changed.notify_all();

        if (index == 0 && !log->released_first) {
            log->changed.wait_for(lock, std::chrono::seconds(5), [&] {
                return log->seen.count(1) && log->seen.count(2) && log->seen.count(3);
            });
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            lock.lock();
            log->released_first = true;
        }
        return VaultResult();
    });

    auto request = download_request(outcome.record, "windowed.out");
    request.options.parallelism = 2;
    ASSERT_TRUE(scheduler_->download(request, cancel_));
    EXPECT_EQ(read_file(test_dir_ / "windowed.out"), data);

    std::lock_guard<std::mutex> lock(log->mutex);
    EXPECT_EQ(log->furthest_before_release, 3u);
    EXPECT_EQ(log->seen.size(), 10u);
}

TEST_F(TransferSchedulerTest, OversizedChunkFailsBeforeTouchingChannel) {
    auto source = write_source("archive.bin", random_bytes(10 * KiB, 15));
    auto limited = std::make_shared<NiceMock<MockRemoteChannel>>(
        std::make_shared<remote::MemoryChannel>(64 * KiB));
    auto catalog = std::make_shared<storage::CatalogManager>(limited);
    TransferScheduler scheduler(limited, catalog);

    EXPECT_CALL(*limited, put_blob(_, _, _)).Times(0);
    EXPECT_CALL(*limited, pin_and_get(_, _)).Times(0);

    UploadOutcome outcome;
    EXPECT_EQ(scheduler.upload(upload_request(source), cancel_, outcome).error,
              VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);
}

TEST_F(TransferSchedulerTest, EncryptionOverheadCountsAgainstBlobLimit) {
    auto source = write_source("archive.bin", random_bytes(100 * KiB, 23));
    auto limited = std::make_shared<NiceMock<MockRemoteChannel>>(
        std::make_shared<remote::MemoryChannel>(64 * KiB));
    auto catalog = std::make_shared<storage::CatalogManager>(limited);
    TransferScheduler scheduler(limited, catalog);

    EXPECT_CALL(*limited, put_blob(_, _, _)).Times(0);
    EXPECT_CALL(*limited, pin_and_get(_, _)).Times(0);

    auto request = upload_request(source);
    request.options.chunk_size = 64 * KiB;
    request.options.compressed = false;
    UploadOutcome outcome;
    EXPECT_EQ(scheduler.upload(request, cancel_, outcome).error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);

    request.options.encrypted = false;
    request.options.compressed = true;
    EXPECT_EQ(scheduler.upload(request, cancel_, outcome).error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);
    EXPECT_EQ(limited->backing().blob_count(), 0u);
}

TEST_F(TransferSchedulerTest, ChunkThatSealsToExactlyTheLimitUploads) {
    auto data = random_bytes(100 * KiB, 24);
    auto source = write_source("archive.bin", data);
    auto limited = std::make_shared<NiceMock<MockRemoteChannel>>(
        std::make_shared<remote::MemoryChannel>(64 * KiB));
    auto catalog = std::make_shared<storage::CatalogManager>(limited);
    TransferScheduler scheduler(limited, catalog);

    auto request = upload_request(source);
    request.options.chunk_size = 64 * KiB - crypto::AEAD_TAG_SIZE;
    request.options.compressed = false;
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler.upload(request, cancel_, outcome));
    ASSERT_EQ(outcome.record.chunk_count(), 2u);
    EXPECT_EQ(outcome.record.chunk_refs[0].ciphertext_size, 64 * KiB);
}

TEST_F(TransferSchedulerTest, MissingPasswordFailsBeforeTouchingChannel) {
    auto source = write_source("archive.bin", random_bytes(10 * KiB, 16));
    EXPECT_CALL(*channel_, put_blob(_, _, _)).Times(0);
    EXPECT_CALL(*channel_, pin_and_get(_, _)).Times(0);

    auto request = upload_request(source);
    request.password.clear();
    UploadOutcome outcome;
    EXPECT_EQ(scheduler_->upload(request, cancel_, outcome).error, VaultError::MISSING_CREDENTIALS);
}

TEST_F(TransferSchedulerTest, MissingSourceIsIoError) {
    UploadOutcome outcome;
    EXPECT_EQ(scheduler_->upload(upload_request(test_dir_ / "absent.bin"), cancel_, outcome).error,
              VaultError::IO_ERROR);
}

TEST_F(TransferSchedulerTest, RemoveUnlinksAndDeletesBlobs) {
    auto source = write_source("archive.bin", random_bytes(250 * KiB, 17));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));
    EXPECT_GT(channel_->backing().blob_count(), 0u);

    ASSERT_TRUE(scheduler_->remove(outcome.record.file_id));
    EXPECT_EQ(channel_->backing().blob_count(), 0u);

    RemoteRef ref;
    EXPECT_EQ(catalog_->lookup(outcome.record.file_id, ref).error, VaultError::NOT_FOUND_IN_CATALOG);
    EXPECT_EQ(scheduler_->remove(outcome.record.file_id).error, VaultError::NOT_FOUND_IN_CATALOG);

    auto status = scheduler_->download(download_request(outcome.record, "gone.bin"), cancel_);
    EXPECT_EQ(status.error, VaultError::CHUNK_MISSING);
}

TEST_F(TransferSchedulerTest, RemoveSurvivesFailedCleanup) {
    auto source = write_source("archive.bin", random_bytes(50 * KiB, 18));
    UploadOutcome outcome;
    ASSERT_TRUE(scheduler_->upload(upload_request(source), cancel_, outcome));

    EXPECT_CALL(*channel_, delete_blobs(_))
        .WillOnce([](const std::vector<RemoteRef>&) {
            return VaultResult(VaultError::UNSUPPORTED, "cannot delete");
        });
    ASSERT_TRUE(scheduler_->remove(outcome.record.file_id));

    storage::CatalogIndex index;
    ASSERT_TRUE(catalog_->read(index));
    EXPECT_TRUE(index.is_taken(outcome.record.file_id));
    EXPECT_TRUE(index.files.empty());
}

TEST(TransferOptionsTest, Validation) {
    TransferOptions options;
    EXPECT_TRUE(options.validate(storage::VaultConfig::MAX_CHUNK_SIZE));

    options.chunk_size = 0;
    EXPECT_EQ(options.validate(1024).error, VaultError::CONFIG_INVALID);

    options.chunk_size = 2048;
    EXPECT_EQ(options.validate(1024).error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);

    options.chunk_size = 1024;
    options.compressed = false;
    EXPECT_EQ(options.validate(1024).error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);
    EXPECT_TRUE(options.validate(1024 + crypto::AEAD_TAG_SIZE));
    options.encrypted = false;
    EXPECT_TRUE(options.validate(1024));
    options.compressed = true;
    EXPECT_EQ(options.validate(1024).error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);
    options.encrypted = true;

    options.chunk_size = 512;
    options.parallelism = 0;
    EXPECT_EQ(options.validate(1024).error, VaultError::CONFIG_INVALID);
}

TEST(TransferOptionsTest, DownloadUsesDownloadParallelism) {
    storage::VaultConfig config;
    config.parallel_uploads = 2;
    config.parallel_downloads = 7;
    EXPECT_EQ(TransferOptions::for_upload(config).parallelism, 2);
    EXPECT_EQ(TransferOptions::for_download(config).parallelism, 7);
}
