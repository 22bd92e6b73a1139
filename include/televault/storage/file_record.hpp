#pragma once

#include "televault/core/result.hpp"
#include "televault/crypto/chunk_pipeline.hpp"
#include "televault/crypto/crypto_types.hpp"
#include "televault/crypto/key_derivation.hpp"
#include "televault/remote/remote_channel.hpp"
#include "televault/storage/chunker.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace televault::storage {

using remote::RemoteRef;

// One stored chunk of a file. (file_id, index) identifies exactly one ref.
struct ChunkRef {
    uint64_t index = 0;
    RemoteRef remote_ref;
    uint64_t ciphertext_size = 0;
    uint64_t plain_size = 0;
    std::optional<crypto::AesGcmNonce> nonce;
    std::optional<crypto::AeadTag> auth_tag;
    std::string blob_hash;

    // Keys this version does not know about, written back unchanged.
    nlohmann::json extra = nlohmann::json::object();

    crypto::ChunkSeal seal() const;
    static ChunkRef from_sealed(uint64_t index, const RemoteRef& ref, const crypto::SealedChunk& sealed);

    nlohmann::json to_json() const;
    static core::VaultResult from_json(const nlohmann::json& j, ChunkRef& out);

    bool operator==(const ChunkRef& other) const;
};

struct FileRecord {
    static constexpr int SCHEMA_VERSION = 1;

    std::string file_id;
    std::string name;
    uint64_t size = 0;
    uint64_t chunk_size = 0;
    std::vector<ChunkRef> chunk_refs;
    std::string content_hash;

    bool encrypted = false;
    bool compressed = false;
    std::optional<crypto::KdfSalt> kdf_salt;
    crypto::KdfParams kdf;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> modified_at;

    RemoteRef anchor_ref;
    std::string mime_type;
    int schema = SCHEMA_VERSION;

    nlohmann::json extra = nlohmann::json::object();

    uint64_t chunk_count() const { return chunk_refs.size(); }
    uint64_t stored_size() const;
    double compression_ratio() const;
    ChunkLayout layout() const;

    // Structural invariants: refs ordered 0..n-1 with n matching the layout,
    // decoded lengths summing to size, a salt present iff encrypted.
    core::VaultResult validate() const;

    nlohmann::json to_json() const;
    std::string serialize() const;

    static core::VaultResult from_json(const nlohmann::json& j, FileRecord& out);
    static core::VaultResult parse(std::span<const uint8_t> bytes, FileRecord& out);
};

// Extension based guess, empty when unknown.
std::string guess_mime_type(const std::string& filename);

} // namespace televault::storage
