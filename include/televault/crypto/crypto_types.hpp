#pragma once

#include <array>
#include <span>
#include <string>
#include <cstdint>

namespace televault::crypto {

constexpr size_t AES256_KEY_SIZE = 32;
constexpr size_t AES_GCM_NONCE_SIZE = 12;
constexpr size_t AES_GCM_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = AES_GCM_TAG_SIZE;

constexpr size_t KDF_SALT_SIZE = 16;
constexpr size_t CONTENT_HASH_SIZE = 32;
constexpr size_t KEY_CHECK_SIZE = 16;

using AesGcmNonce = std::array<std::uint8_t, AES_GCM_NONCE_SIZE>;
using AeadTag = std::array<std::uint8_t, AEAD_TAG_SIZE>;
using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;
using KdfSalt = std::array<std::uint8_t, KDF_SALT_SIZE>;

// 256-bit AES-GCM key derived from the vault password. The bytes are wiped
// on destruction and whenever the key is overwritten.
class SymmetricKey {
public:
    SymmetricKey();
    explicit SymmetricKey(std::span<const std::uint8_t> bytes);
    ~SymmetricKey();

    SymmetricKey(const SymmetricKey& other);
    SymmetricKey& operator=(const SymmetricKey& other);

    // Constant-time comparison.
    bool operator==(const SymmetricKey& other) const;
    bool operator!=(const SymmetricKey& other) const { return !(*this == other); }

    void wipe();

    const std::uint8_t* data() const { return bytes_.data(); }
    std::uint8_t* data() { return bytes_.data(); }
    static constexpr size_t size() { return AES256_KEY_SIZE; }

    std::span<const std::uint8_t> span() const { return std::span(bytes_); }

private:
    std::array<std::uint8_t, AES256_KEY_SIZE> bytes_;
};

inline std::span<const std::uint8_t> as_bytes(const std::string& str) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
}

}
