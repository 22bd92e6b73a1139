#include "televault/crypto/crypto_types.hpp"
#include <algorithm>
#include <stdexcept>

#include <sodium.h>

namespace televault::crypto {

SymmetricKey::SymmetricKey() {
    wipe();
}

SymmetricKey::SymmetricKey(std::span<const std::uint8_t> bytes) {
    if (bytes.size() != AES256_KEY_SIZE) {
        throw std::invalid_argument("AES-256 key must be " + std::to_string(AES256_KEY_SIZE) +
                                    " bytes, got " + std::to_string(bytes.size()));
    }
    std::copy(bytes.begin(), bytes.end(), bytes_.begin());
}

SymmetricKey::~SymmetricKey() {
    wipe();
}

SymmetricKey::SymmetricKey(const SymmetricKey& other) : bytes_(other.bytes_) {}

SymmetricKey& SymmetricKey::operator=(const SymmetricKey& other) {
    if (this != &other) {
        wipe();
        bytes_ = other.bytes_;
    }
    return *this;
}

bool SymmetricKey::operator==(const SymmetricKey& other) const {
    return sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

void SymmetricKey::wipe() {
    sodium_memzero(bytes_.data(), bytes_.size());
}

}
