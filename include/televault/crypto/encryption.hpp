#pragma once

#include "televault/crypto/crypto_types.hpp"
#include "televault/core/result.hpp"
#include <memory>
#include <vector>

namespace televault::crypto {

// AES-256-GCM. Output layout is ciphertext || tag.
class EncryptionEngine {
public:
    EncryptionEngine();
    ~EncryptionEngine();

    // AES-GCM needs hardware support in libsodium.
    static bool is_available();

    core::VaultResult encrypt(std::span<const std::uint8_t> plaintext,
                              std::span<const std::uint8_t> additional_data,
                              const SymmetricKey& key,
                              const AesGcmNonce& nonce,
                              std::vector<std::uint8_t>& out_ciphertext) const;

    core::VaultResult decrypt(std::span<const std::uint8_t> ciphertext,
                              std::span<const std::uint8_t> additional_data,
                              const SymmetricKey& key,
                              const AesGcmNonce& nonce,
                              std::vector<std::uint8_t>& out_plaintext) const;

    static AeadTag extract_tag(std::span<const std::uint8_t> ciphertext);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
