#include "televault/storage/resume_manager.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/hash.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>

namespace televault::storage {

using nlohmann::json;
using core::utils::TimeUtils;

std::set<uint64_t> TransferProgress::completed_indices() const {
    std::set<uint64_t> indices;
    for (const auto& [index, chunk] : completed) {
        indices.insert(index);
    }
    return indices;
}

ResumeManager::ResumeManager(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

ResumeManager::~ResumeManager() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool ResumeManager::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        return true;
    }

    if (db_path_.has_parent_path()) {
        core::utils::FileUtils::create_directories(db_path_.parent_path());
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_WARN("Cannot open progress database {}: {}", db_path_.string(),
                 db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

bool ResumeManager::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

bool ResumeManager::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_WARN("Progress database error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool ResumeManager::create_tables() {
    const char* create_progress_table = R"(
        CREATE TABLE IF NOT EXISTS transfer_progress (
            file_id TEXT PRIMARY KEY,
            source_path TEXT NOT NULL UNIQUE,
            header_json TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )";

    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS chunk_progress (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            chunk_json TEXT NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_progress_updated_at ON transfer_progress(updated_at);
    )";

    return exec(create_progress_table) && exec(create_chunks_table) && exec(create_indexes);
}

std::string ResumeManager::normalize_path(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::string ResumeManager::serialize_header(const TransferProgress& progress) {
    json j;
    j["source_size"] = progress.source_size;
    j["source_mtime"] = progress.source_mtime;
    j["content_hash"] = progress.content_hash;
    j["chunk_size"] = progress.chunk_size;
    j["encrypted"] = progress.encrypted;
    j["compressed"] = progress.compressed;
    j["kdf_salt"] = progress.kdf_salt ? json(crypto::hash_utils::to_hex(*progress.kdf_salt)) : json(nullptr);
    j["kdf"] = {{"n", progress.kdf.n}, {"r", progress.kdf.r}, {"p", progress.kdf.p}};
    j["key_check"] = progress.key_check;
    j["anchor"] = progress.anchor_ref;
    return j.dump();
}

bool ResumeManager::deserialize_header(const std::string& text, TransferProgress& progress) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    try {
        progress.source_size = j.at("source_size").get<uint64_t>();
        progress.source_mtime = j.at("source_mtime").get<int64_t>();
        progress.content_hash = j.at("content_hash").get<std::string>();
        progress.chunk_size = j.at("chunk_size").get<uint64_t>();
        progress.encrypted = j.at("encrypted").get<bool>();
        progress.compressed = j.at("compressed").get<bool>();
        progress.key_check = j.value("key_check", std::string());
        progress.anchor_ref = j.at("anchor").get<std::string>();

        progress.kdf_salt.reset();
        if (j.at("kdf_salt").is_string()) {
            auto salt = crypto::hash_utils::array_from_hex<crypto::KDF_SALT_SIZE>(j.at("kdf_salt").get<std::string>());
            if (!salt) {
                return false;
            }
            progress.kdf_salt = *salt;
        }
        const auto& kdf = j.at("kdf");
        progress.kdf.n = kdf.at("n").get<uint64_t>();
        progress.kdf.r = kdf.at("r").get<uint32_t>();
        progress.kdf.p = kdf.at("p").get<uint32_t>();
    } catch (const json::exception&) {
        return false;
    }
    return true;
}

bool ResumeManager::save_progress(const TransferProgress& progress) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }

    auto source_path = normalize_path(progress.source_path);
    auto header = serialize_header(progress);
    auto now = static_cast<int64_t>(TimeUtils::to_unix_seconds(TimeUtils::now()));

    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }

    // Drop a stale attempt for the same source along with its chunks.
    const char* select_sql = "SELECT file_id FROM transfer_progress WHERE source_path = ? AND file_id != ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        exec("ROLLBACK;");
        return false;
    }
    sqlite3_bind_text(stmt, 1, source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, progress.file_id.c_str(), -1, SQLITE_TRANSIENT);
    std::vector<std::string> stale;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        stale.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    for (const auto& file_id : stale) {
        if (!remove_locked(file_id)) {
            exec("ROLLBACK;");
            return false;
        }
    }

    const char* upsert_sql = R"(
        INSERT OR REPLACE INTO transfer_progress (file_id, source_path, header_json, updated_at)
        VALUES (?, ?, ?, ?);
    )";
    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        exec("ROLLBACK;");
        return false;
    }
    sqlite3_bind_text(stmt, 1, progress.file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, header.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, now);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        LOG_WARN("Failed to save progress for {}: {}", progress.file_id, sqlite3_errmsg(db_));
        exec("ROLLBACK;");
        return false;
    }

    const char* chunk_sql = "INSERT OR REPLACE INTO chunk_progress (file_id, chunk_index, chunk_json) VALUES (?, ?, ?);";
    for (const auto& [index, chunk] : progress.completed) {
        if (sqlite3_prepare_v2(db_, chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            exec("ROLLBACK;");
            return false;
        }
        auto chunk_json = chunk.to_json().dump();
        sqlite3_bind_text(stmt, 1, progress.file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(index));
        sqlite3_bind_text(stmt, 3, chunk_json.c_str(), -1, SQLITE_TRANSIENT);
        result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            exec("ROLLBACK;");
            return false;
        }
    }

    return exec("COMMIT;");
}

bool ResumeManager::record_chunk(const std::string& file_id, const ChunkRef& chunk) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }

    const char* chunk_sql = "INSERT OR REPLACE INTO chunk_progress (file_id, chunk_index, chunk_json) VALUES (?, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    auto chunk_json = chunk.to_json().dump();
    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk.index));
    sqlite3_bind_text(stmt, 3, chunk_json.c_str(), -1, SQLITE_TRANSIENT);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        LOG_WARN("Failed to record chunk {} of {}: {}", chunk.index, file_id, sqlite3_errmsg(db_));
        return false;
    }

    const char* touch_sql = "UPDATE transfer_progress SET updated_at = ? WHERE file_id = ?;";
    if (sqlite3_prepare_v2(db_, touch_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(TimeUtils::to_unix_seconds(TimeUtils::now())));
        sqlite3_bind_text(stmt, 2, file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(stmt);
        sqlite3_finalize(stmt);
    }
    return true;
}

std::optional<TransferProgress> ResumeManager::load_where(const char* sql, const std::string& key) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    TransferProgress progress;
    progress.file_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    progress.source_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    std::string header = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    progress.updated_at = TimeUtils::from_unix_seconds(static_cast<double>(sqlite3_column_int64(stmt, 3)));
    sqlite3_finalize(stmt);

    if (!deserialize_header(header, progress) || !load_chunks(progress)) {
        LOG_WARN("Progress record for {} is unreadable, ignoring it", progress.file_id);
        return std::nullopt;
    }
    return progress;
}

bool ResumeManager::load_chunks(TransferProgress& progress) {
    const char* select_sql = "SELECT chunk_index, chunk_json FROM chunk_progress WHERE file_id = ? ORDER BY chunk_index;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, progress.file_id.c_str(), -1, SQLITE_TRANSIENT);

    bool ok = true;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto index = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        auto j = json::parse(text ? text : "", nullptr, false);
        ChunkRef chunk;
        if (j.is_discarded() || !ChunkRef::from_json(j, chunk) || chunk.index != index) {
            ok = false;
            break;
        }
        progress.completed.emplace(index, std::move(chunk));
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<TransferProgress> ResumeManager::load_progress(const std::filesystem::path& source_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return std::nullopt;
    }
    return load_where(
        "SELECT file_id, source_path, header_json, updated_at FROM transfer_progress WHERE source_path = ?;",
        normalize_path(source_path));
}

std::optional<TransferProgress> ResumeManager::load_progress_by_id(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return std::nullopt;
    }
    return load_where(
        "SELECT file_id, source_path, header_json, updated_at FROM transfer_progress WHERE file_id = ?;",
        file_id);
}

bool ResumeManager::remove_locked(const std::string& file_id) {
    const char* statements[] = {
        "DELETE FROM chunk_progress WHERE file_id = ?;",
        "DELETE FROM transfer_progress WHERE file_id = ?;",
    };
    for (const char* sql : statements) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            return false;
        }
    }
    return true;
}

bool ResumeManager::remove_progress(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }
    return remove_locked(file_id);
}

std::vector<TransferProgress> ResumeManager::list_resumable() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) {
            return {};
        }
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "SELECT file_id FROM transfer_progress ORDER BY updated_at DESC;",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            return {};
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ids.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        }
        sqlite3_finalize(stmt);
    }

    std::vector<TransferProgress> transfers;
    for (const auto& file_id : ids) {
        if (auto progress = load_progress_by_id(file_id)) {
            transfers.push_back(std::move(*progress));
        }
    }
    return transfers;
}

void ResumeManager::cleanup_old_progress(std::chrono::hours max_age) {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return;
    }

    auto cutoff = static_cast<int64_t>(TimeUtils::to_unix_seconds(TimeUtils::now() - max_age));
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT file_id FROM transfer_progress WHERE updated_at < ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return;
    }
    sqlite3_bind_int64(stmt, 1, cutoff);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);

    for (const auto& file_id : ids) {
        if (remove_locked(file_id)) {
            LOG_DEBUG("Dropped stale progress record {}", file_id);
        }
    }
}

size_t ResumeManager::get_progress_count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transfer_progress;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace televault::storage
