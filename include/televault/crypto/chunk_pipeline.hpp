#pragma once

#include "televault/crypto/crypto_types.hpp"
#include "televault/crypto/compression.hpp"
#include "televault/crypto/encryption.hpp"
#include "televault/core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace televault::crypto {

// Everything needed to verify and reverse the transform of one stored chunk.
struct ChunkSeal {
    std::uint64_t plain_size = 0;
    std::string blob_hash;
    std::optional<AesGcmNonce> nonce;
    std::optional<AeadTag> tag;
};

struct SealedChunk {
    std::vector<std::uint8_t> blob;
    ChunkSeal seal;
};

struct PipelineSettings {
    bool compress = false;
    bool encrypt = false;
    int compression_level = Compressor::DEFAULT_LEVEL;
};

// Per-chunk compress -> encrypt transform and its inverse. Stateless apart from
// the key, so one instance is shared by all transfer workers of a file.
class ChunkPipeline {
public:
    ChunkPipeline(PipelineSettings settings, std::optional<SymmetricKey> key);

    // Fails fast on configurations that could never succeed.
    core::VaultResult validate() const;

    core::VaultResult seal(const std::string& file_id,
                           std::uint64_t index,
                           std::span<const std::uint8_t> plaintext,
                           SealedChunk& out) const;

    // Blob integrity is checked before decryption: a blob that no longer
    // matches its recorded digest or tag is TamperedOrCorrupt, an intact blob
    // that fails authentication is DecryptionFailed.
    core::VaultResult open(const std::string& file_id,
                           std::uint64_t index,
                           const ChunkSeal& seal,
                           std::span<const std::uint8_t> blob,
                           std::vector<std::uint8_t>& out_plaintext) const;

    const PipelineSettings& settings() const { return settings_; }

    // Upper bound on the stored blob for a chunk of plain_size bytes.
    static std::uint64_t max_sealed_size(std::uint64_t plain_size, bool compress, bool encrypt);

    // Binds a ciphertext to its slot in one file.
    static std::string associated_data(const std::string& file_id, std::uint64_t index);

private:
    PipelineSettings settings_;
    std::optional<SymmetricKey> key_;
    EncryptionEngine engine_;
};

}
