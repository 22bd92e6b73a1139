#include "televault/crypto/chunk_pipeline.hpp"
#include "televault/crypto/hash.hpp"
#include "televault/crypto/random.hpp"
#include <sodium.h>

namespace televault::crypto {

ChunkPipeline::ChunkPipeline(PipelineSettings settings, std::optional<SymmetricKey> key)
    : settings_(settings)
    , key_(std::move(key)) {
}

core::VaultResult ChunkPipeline::validate() const {
    if (settings_.encrypt && !key_) {
        return core::VaultResult(core::VaultError::MISSING_CREDENTIALS,
            "Encryption enabled but no key was supplied");
    }
    if (settings_.encrypt && !EncryptionEngine::is_available()) {
        return core::VaultResult(core::VaultError::ENCRYPTION_FAILED,
            "AES-256-GCM is not supported on this CPU");
    }
    return core::VaultResult();
}

std::uint64_t ChunkPipeline::max_sealed_size(std::uint64_t plain_size, bool compress, bool encrypt) {
    auto size = compress ? Compressor::max_compressed_size(plain_size) : plain_size;
    return encrypt ? size + AEAD_TAG_SIZE : size;
}

std::string ChunkPipeline::associated_data(const std::string& file_id, std::uint64_t index) {
    return "televault:" + file_id + ":" + std::to_string(index);
}

core::VaultResult ChunkPipeline::seal(const std::string& file_id,
                                      std::uint64_t index,
                                      std::span<const std::uint8_t> plaintext,
                                      SealedChunk& out) const {
    auto status = validate();
    if (!status) {
        return status;
    }

    out.seal = ChunkSeal{};
    out.seal.plain_size = plaintext.size();

    std::vector<std::uint8_t> compressed;
    std::span<const std::uint8_t> payload = plaintext;
    if (settings_.compress) {
        status = Compressor::compress(plaintext, compressed, settings_.compression_level);
        if (!status) {
            return status.at_chunk(index);
        }
        payload = std::span(compressed);
    }

    if (settings_.encrypt) {
        auto nonce = SecureRandom::generate_nonce();
        auto aad = associated_data(file_id, index);
        status = engine_.encrypt(payload, as_bytes(aad), *key_, nonce, out.blob);
        if (!status) {
            return status.at_chunk(index);
        }
        out.seal.nonce = nonce;
        out.seal.tag = EncryptionEngine::extract_tag(out.blob);
    } else {
        out.blob.assign(payload.begin(), payload.end());
    }

    out.seal.blob_hash = hash_utils::hash_hex(out.blob);
    return core::VaultResult();
}

core::VaultResult ChunkPipeline::open(const std::string& file_id,
                                      std::uint64_t index,
                                      const ChunkSeal& seal,
                                      std::span<const std::uint8_t> blob,
                                      std::vector<std::uint8_t>& out_plaintext) const {
    auto status = validate();
    if (!status) {
        return status;
    }

    if (!seal.blob_hash.empty() && hash_utils::hash_hex(blob) != seal.blob_hash) {
        return core::VaultResult(core::VaultError::TAMPERED_OR_CORRUPT,
            "Stored chunk does not match its recorded digest").at_chunk(index);
    }

    std::vector<std::uint8_t> decrypted;
    std::span<const std::uint8_t> payload = blob;
    if (settings_.encrypt) {
        if (!seal.nonce) {
            return core::VaultResult(core::VaultError::TAMPERED_OR_CORRUPT,
                "Encrypted chunk has no nonce").at_chunk(index);
        }
        if (blob.size() < AEAD_TAG_SIZE) {
            return core::VaultResult(core::VaultError::TAMPERED_OR_CORRUPT,
                "Encrypted chunk is shorter than its tag").at_chunk(index);
        }
        if (seal.tag) {
            auto stored_tag = EncryptionEngine::extract_tag(blob);
            if (sodium_memcmp(stored_tag.data(), seal.tag->data(), AEAD_TAG_SIZE) != 0) {
                return core::VaultResult(core::VaultError::TAMPERED_OR_CORRUPT,
                    "Authentication tag does not match the recorded tag").at_chunk(index);
            }
        }

        auto aad = associated_data(file_id, index);
        status = engine_.decrypt(blob, as_bytes(aad), *key_, *seal.nonce, decrypted);
        if (!status) {
            return status.at_chunk(index);
        }
        payload = std::span(decrypted);
    }

    if (settings_.compress) {
        status = Compressor::decompress(payload, seal.plain_size, out_plaintext);
        if (!status) {
            return status.at_chunk(index);
        }
    } else {
        out_plaintext.assign(payload.begin(), payload.end());
    }

    if (settings_.encrypt) {
        sodium_memzero(decrypted.data(), decrypted.size());
    }

    if (out_plaintext.size() != seal.plain_size) {
        auto decoded_size = out_plaintext.size();
        out_plaintext.clear();
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Chunk decoded to " + std::to_string(decoded_size) +
            " bytes, expected " + std::to_string(seal.plain_size)).at_chunk(index);
    }

    return core::VaultResult();
}

}
