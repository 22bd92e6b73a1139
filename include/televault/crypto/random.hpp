#pragma once

#include "televault/crypto/crypto_types.hpp"
#include "televault/core/result.hpp"
#include <atomic>
#include <string>

namespace televault::crypto {

class SecureRandom {
public:
    // Idempotent; must succeed before any other call.
    static bool initialize();

    static core::VaultResult generate_bytes(std::span<std::uint8_t> output);

    static AesGcmNonce generate_nonce();
    static KdfSalt generate_salt();

    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    // Lowercase hex string of byte_count random bytes.
    static std::string generate_hex_id(size_t byte_count);

private:
    static std::atomic<bool> initialized_;
};

}
