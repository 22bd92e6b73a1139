#include "televault/crypto/random.hpp"
#include "televault/crypto/hash.hpp"
#include "televault/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace televault::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_.store(true);
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

core::VaultResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Random generator not initialized");
    }

    if (output.empty()) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return core::VaultResult();
}

AesGcmNonce SecureRandom::generate_nonce() {
    AesGcmNonce nonce;
    auto status = generate_bytes(std::span(nonce));
    if (!status.success()) {
        throw std::runtime_error("Failed to generate nonce: " + status.message);
    }
    return nonce;
}

KdfSalt SecureRandom::generate_salt() {
    KdfSalt salt;
    auto status = generate_bytes(std::span(salt));
    if (!status.success()) {
        throw std::runtime_error("Failed to generate salt: " + status.message);
    }
    return salt;
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    initialize();
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_hex_id(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    auto status = generate_bytes(std::span(bytes));
    if (!status.success()) {
        throw std::runtime_error("Failed to generate id: " + status.message);
    }
    return hash_utils::to_hex(bytes);
}

}
