#pragma once

#include "televault/storage/file_record.hpp"
#include "televault/crypto/key_derivation.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>

struct sqlite3;

namespace televault::storage {

// Local, advisory record of an unfinished upload. Holds everything needed to
// finish the FileRecord without re-sending the chunks listed here.
struct TransferProgress {
    std::string file_id;
    std::string source_path;
    uint64_t source_size = 0;
    int64_t source_mtime = 0;
    std::string content_hash;

    uint64_t chunk_size = 0;
    bool encrypted = false;
    bool compressed = false;
    std::optional<crypto::KdfSalt> kdf_salt;
    crypto::KdfParams kdf;
    std::string key_check;

    remote::RemoteRef anchor_ref;
    std::map<uint64_t, ChunkRef> completed;
    std::chrono::system_clock::time_point updated_at;

    std::set<uint64_t> completed_indices() const;
};

class ResumeManager {
public:
    explicit ResumeManager(const std::filesystem::path& database_path);
    ~ResumeManager();

    ResumeManager(const ResumeManager&) = delete;
    ResumeManager& operator=(const ResumeManager&) = delete;

    bool initialize();
    bool is_open() const;

    // Replaces any record for the same source path.
    bool save_progress(const TransferProgress& progress);
    bool record_chunk(const std::string& file_id, const ChunkRef& chunk);

    std::optional<TransferProgress> load_progress(const std::filesystem::path& source_path);
    std::optional<TransferProgress> load_progress_by_id(const std::string& file_id);

    bool remove_progress(const std::string& file_id);

    std::vector<TransferProgress> list_resumable();
    void cleanup_old_progress(std::chrono::hours max_age = std::chrono::hours(72));
    size_t get_progress_count() const;

    static std::string normalize_path(const std::filesystem::path& path);

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;

    bool create_tables();
    bool exec(const char* sql);
    std::optional<TransferProgress> load_where(const char* sql, const std::string& key);
    bool load_chunks(TransferProgress& progress);
    bool remove_locked(const std::string& file_id);

    static std::string serialize_header(const TransferProgress& progress);
    static bool deserialize_header(const std::string& text, TransferProgress& progress);
};

} // namespace televault::storage
