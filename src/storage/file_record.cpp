#include "televault/storage/file_record.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/hash.hpp"
#include <unordered_map>
#include <unordered_set>

namespace televault::storage {

using nlohmann::json;
using core::utils::TimeUtils;

namespace {

const std::unordered_set<std::string> CHUNK_KEYS = {
    "index", "ref", "ciphertext_size", "plain_size", "nonce", "tag", "blob_hash"
};

const std::unordered_set<std::string> RECORD_KEYS = {
    "schema", "id", "name", "size", "chunk_size", "hash", "chunks",
    "encrypted", "compressed", "kdf_salt", "kdf", "created_at", "modified_at",
    "anchor", "mime_type", "stored_size", "compression_ratio"
};

json collect_unknown(const json& j, const std::unordered_set<std::string>& known) {
    json extra = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (known.count(it.key()) == 0) {
            extra[it.key()] = it.value();
        }
    }
    return extra;
}

void merge_unknown(json& j, const json& extra) {
    if (!extra.is_object()) {
        return;
    }
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        if (!j.contains(it.key())) {
            j[it.key()] = it.value();
        }
    }
}

template<size_t N>
bool read_hex_array(const json& j, const char* key, std::optional<std::array<uint8_t, N>>& out) {
    out.reset();
    if (!j.contains(key) || j.at(key).is_null()) {
        return true;
    }
    auto parsed = crypto::hash_utils::array_from_hex<N>(j.at(key).get<std::string>());
    if (!parsed) {
        return false;
    }
    out = *parsed;
    return true;
}

core::VaultResult malformed(const std::string& what) {
    return core::VaultResult(core::VaultError::CATALOG_CORRUPT, "Malformed file record: " + what);
}

}

crypto::ChunkSeal ChunkRef::seal() const {
    crypto::ChunkSeal s;
    s.plain_size = plain_size;
    s.blob_hash = blob_hash;
    s.nonce = nonce;
    s.tag = auth_tag;
    return s;
}

ChunkRef ChunkRef::from_sealed(uint64_t index, const RemoteRef& ref, const crypto::SealedChunk& sealed) {
    ChunkRef chunk;
    chunk.index = index;
    chunk.remote_ref = ref;
    chunk.ciphertext_size = sealed.blob.size();
    chunk.plain_size = sealed.seal.plain_size;
    chunk.nonce = sealed.seal.nonce;
    chunk.auth_tag = sealed.seal.tag;
    chunk.blob_hash = sealed.seal.blob_hash;
    return chunk;
}

json ChunkRef::to_json() const {
    json j;
    j["index"] = index;
    j["ref"] = remote_ref;
    j["ciphertext_size"] = ciphertext_size;
    j["plain_size"] = plain_size;
    if (nonce) {
        j["nonce"] = crypto::hash_utils::to_hex(*nonce);
    }
    if (auth_tag) {
        j["tag"] = crypto::hash_utils::to_hex(*auth_tag);
    }
    j["blob_hash"] = blob_hash;
    merge_unknown(j, extra);
    return j;
}

core::VaultResult ChunkRef::from_json(const json& j, ChunkRef& out) {
    if (!j.is_object()) {
        return malformed("chunk entry is not an object");
    }
    try {
        ChunkRef chunk;
        chunk.index = j.at("index").get<uint64_t>();
        chunk.remote_ref = j.at("ref").get<std::string>();
        chunk.ciphertext_size = j.at("ciphertext_size").get<uint64_t>();
        chunk.plain_size = j.value("plain_size", uint64_t{0});
        chunk.blob_hash = j.value("blob_hash", std::string());
        if (!read_hex_array(j, "nonce", chunk.nonce) || !read_hex_array(j, "tag", chunk.auth_tag)) {
            return malformed("bad nonce or tag in chunk " + std::to_string(chunk.index));
        }
        chunk.extra = collect_unknown(j, CHUNK_KEYS);
        out = std::move(chunk);
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return core::VaultResult();
}

bool ChunkRef::operator==(const ChunkRef& other) const {
    return index == other.index && remote_ref == other.remote_ref &&
           ciphertext_size == other.ciphertext_size && plain_size == other.plain_size &&
           nonce == other.nonce && auth_tag == other.auth_tag &&
           blob_hash == other.blob_hash && extra == other.extra;
}

uint64_t FileRecord::stored_size() const {
    uint64_t total = 0;
    for (const auto& chunk : chunk_refs) {
        total += chunk.ciphertext_size;
    }
    return total;
}

double FileRecord::compression_ratio() const {
    if (size == 0) {
        return 1.0;
    }
    return static_cast<double>(stored_size()) / static_cast<double>(size);
}

ChunkLayout FileRecord::layout() const {
    return ChunkLayout(size, chunk_size == 0 ? 1 : chunk_size);
}

core::VaultResult FileRecord::validate() const {
    if (file_id.empty()) {
        return malformed("empty file id");
    }
    if (chunk_size == 0 && size > 0) {
        return malformed("zero chunk size");
    }
    if (encrypted != kdf_salt.has_value()) {
        return malformed("kdf salt must be present exactly when encrypted");
    }

    auto expected = layout();
    if (chunk_refs.size() != expected.chunk_count()) {
        return core::VaultResult(core::VaultError::INCOMPLETE_SEQUENCE,
            "Record lists " + std::to_string(chunk_refs.size()) + " chunks, layout needs " +
            std::to_string(expected.chunk_count())).for_file(file_id);
    }

    uint64_t plain_total = 0;
    for (uint64_t i = 0; i < chunk_refs.size(); ++i) {
        const auto& chunk = chunk_refs[i];
        if (chunk.index != i) {
            return core::VaultResult(core::VaultError::INCOMPLETE_SEQUENCE,
                "Chunk refs out of order").for_file(file_id).at_chunk(i);
        }
        if (chunk.plain_size != expected.range(i).length) {
            return core::VaultResult(core::VaultError::SIZE_MISMATCH,
                "Chunk plain size disagrees with layout").for_file(file_id).at_chunk(i);
        }
        if (encrypted && !chunk.nonce) {
            return malformed("encrypted chunk " + std::to_string(i) + " has no nonce");
        }
        plain_total += chunk.plain_size;
    }
    if (plain_total != size) {
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Chunk sizes sum to " + std::to_string(plain_total) +
            ", record says " + std::to_string(size)).for_file(file_id);
    }
    return core::VaultResult();
}

json FileRecord::to_json() const {
    json j;
    j["schema"] = schema;
    j["id"] = file_id;
    j["name"] = name;
    j["size"] = size;
    j["chunk_size"] = chunk_size;
    j["hash"] = content_hash;

    json chunks = json::array();
    for (const auto& chunk : chunk_refs) {
        chunks.push_back(chunk.to_json());
    }
    j["chunks"] = std::move(chunks);

    j["encrypted"] = encrypted;
    j["compressed"] = compressed;
    j["kdf_salt"] = kdf_salt ? json(crypto::hash_utils::to_hex(*kdf_salt)) : json(nullptr);
    j["kdf"] = {{"n", kdf.n}, {"r", kdf.r}, {"p", kdf.p}};
    j["created_at"] = TimeUtils::to_unix_seconds(created_at);
    j["modified_at"] = modified_at ? json(TimeUtils::to_unix_seconds(*modified_at)) : json(nullptr);
    j["anchor"] = anchor_ref;
    j["mime_type"] = mime_type.empty() ? json(nullptr) : json(mime_type);
    j["stored_size"] = stored_size();
    j["compression_ratio"] = compression_ratio();

    merge_unknown(j, extra);
    return j;
}

std::string FileRecord::serialize() const {
    return to_json().dump();
}

core::VaultResult FileRecord::from_json(const json& j, FileRecord& out) {
    if (!j.is_object()) {
        return malformed("not a JSON object");
    }
    try {
        FileRecord record;
        record.schema = j.value("schema", 1);
        record.file_id = j.at("id").get<std::string>();
        record.name = j.at("name").get<std::string>();
        record.size = j.at("size").get<uint64_t>();
        record.chunk_size = j.value("chunk_size", uint64_t{0});
        record.content_hash = j.at("hash").get<std::string>();
        record.encrypted = j.value("encrypted", false);
        record.compressed = j.value("compressed", false);

        for (const auto& entry : j.at("chunks")) {
            ChunkRef chunk;
            auto status = ChunkRef::from_json(entry, chunk);
            if (!status) {
                return status.for_file(record.file_id);
            }
            record.chunk_refs.push_back(std::move(chunk));
        }

        if (!read_hex_array(j, "kdf_salt", record.kdf_salt)) {
            return malformed("bad kdf salt");
        }
        if (j.contains("kdf") && j.at("kdf").is_object()) {
            const auto& kdf = j.at("kdf");
            record.kdf.n = kdf.value("n", record.kdf.n);
            record.kdf.r = kdf.value("r", record.kdf.r);
            record.kdf.p = kdf.value("p", record.kdf.p);
        }

        record.created_at = TimeUtils::from_unix_seconds(j.value("created_at", 0.0));
        if (j.contains("modified_at") && j.at("modified_at").is_number()) {
            record.modified_at = TimeUtils::from_unix_seconds(j.at("modified_at").get<double>());
        }
        record.anchor_ref = j.value("anchor", std::string());
        if (j.contains("mime_type") && j.at("mime_type").is_string()) {
            record.mime_type = j.at("mime_type").get<std::string>();
        }

        record.extra = collect_unknown(j, RECORD_KEYS);
        out = std::move(record);
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return core::VaultResult();
}

core::VaultResult FileRecord::parse(std::span<const uint8_t> bytes, FileRecord& out) {
    auto j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded()) {
        return malformed("invalid JSON");
    }
    return from_json(j, out);
}

std::string guess_mime_type(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"}, {".md", "text/markdown"}, {".csv", "text/csv"},
        {".json", "application/json"}, {".xml", "application/xml"},
        {".html", "text/html"}, {".htm", "text/html"},
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".webp", "image/webp"},
        {".mp4", "video/mp4"}, {".mkv", "video/x-matroska"}, {".webm", "video/webm"},
        {".mp3", "audio/mpeg"}, {".flac", "audio/flac"}, {".ogg", "audio/ogg"},
        {".pdf", "application/pdf"}, {".zip", "application/zip"},
        {".gz", "application/gzip"}, {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
    };
    auto extension = core::utils::FileUtils::get_file_extension(std::filesystem::path(filename));
    auto it = types.find(extension);
    return it == types.end() ? std::string() : it->second;
}

} // namespace televault::storage
