#include "televault/crypto/encryption.hpp"
#include "televault/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>

namespace televault::crypto {

static_assert(crypto_aead_aes256gcm_KEYBYTES == AES256_KEY_SIZE);
static_assert(crypto_aead_aes256gcm_NPUBBYTES == AES_GCM_NONCE_SIZE);
static_assert(crypto_aead_aes256gcm_ABYTES == AES_GCM_TAG_SIZE);

struct EncryptionEngine::Impl {
    bool available = false;

    Impl() {
        available = SecureRandom::initialize() && crypto_aead_aes256gcm_is_available() != 0;
    }
};

EncryptionEngine::EncryptionEngine()
    : impl_(std::make_unique<Impl>()) {
}

EncryptionEngine::~EncryptionEngine() = default;

bool EncryptionEngine::is_available() {
    return SecureRandom::initialize() && crypto_aead_aes256gcm_is_available() != 0;
}

core::VaultResult EncryptionEngine::encrypt(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> additional_data,
    const SymmetricKey& key,
    const AesGcmNonce& nonce,
    std::vector<std::uint8_t>& out_ciphertext) const {

    if (!impl_->available) {
        return core::VaultResult(core::VaultError::ENCRYPTION_FAILED,
            "AES-256-GCM is not supported on this CPU");
    }

    out_ciphertext.resize(plaintext.size() + AEAD_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    int result = crypto_aead_aes256gcm_encrypt(
        out_ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        additional_data.data(),
        additional_data.size(),
        nullptr,  // nsec (not used)
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        out_ciphertext.clear();
        return core::VaultResult(core::VaultError::ENCRYPTION_FAILED, "AES-256-GCM encryption failed");
    }

    out_ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return core::VaultResult();
}

core::VaultResult EncryptionEngine::decrypt(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> additional_data,
    const SymmetricKey& key,
    const AesGcmNonce& nonce,
    std::vector<std::uint8_t>& out_plaintext) const {

    if (!impl_->available) {
        return core::VaultResult(core::VaultError::DECRYPTION_FAILED,
            "AES-256-GCM is not supported on this CPU");
    }

    if (ciphertext.size() < AEAD_TAG_SIZE) {
        return core::VaultResult(core::VaultError::DECRYPTION_FAILED, "Ciphertext shorter than tag");
    }

    out_plaintext.resize(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;

    int result = crypto_aead_aes256gcm_decrypt(
        out_plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        ciphertext.data(),
        ciphertext.size(),
        additional_data.data(),
        additional_data.size(),
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        sodium_memzero(out_plaintext.data(), out_plaintext.size());
        out_plaintext.clear();
        return core::VaultResult(core::VaultError::DECRYPTION_FAILED,
            "Authentication failed (wrong password or corrupted data)");
    }

    out_plaintext.resize(static_cast<size_t>(plaintext_len));
    return core::VaultResult();
}

AeadTag EncryptionEngine::extract_tag(std::span<const std::uint8_t> ciphertext) {
    AeadTag tag{};
    if (ciphertext.size() >= AEAD_TAG_SIZE) {
        std::copy(ciphertext.end() - AEAD_TAG_SIZE, ciphertext.end(), tag.begin());
    }
    return tag;
}

}
