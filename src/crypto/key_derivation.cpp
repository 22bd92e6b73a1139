#include "televault/crypto/key_derivation.hpp"
#include "televault/crypto/hash.hpp"
#include "televault/crypto/random.hpp"
#include "televault/core/logger.hpp"
#include <sodium.h>

namespace televault::crypto {

namespace {
    constexpr char KEY_CHECK_CONTEXT[] = "televault-key-check-v1";
}

bool KdfParams::valid() const {
    if (n < 2 || (n & (n - 1)) != 0) {
        return false;
    }
    if (r == 0 || p == 0) {
        return false;
    }
    return static_cast<std::uint64_t>(r) * p < (1ULL << 30);
}

core::VaultResult KeyDerivation::derive_key(const std::string& password,
                                            std::span<const std::uint8_t> salt,
                                            const KdfParams& params,
                                            SymmetricKey& out_key) {
    if (!SecureRandom::initialize()) {
        return core::VaultResult(core::VaultError::KEY_DERIVATION_FAILED, "libsodium unavailable");
    }

    if (!params.valid()) {
        return core::VaultResult(core::VaultError::KEY_DERIVATION_FAILED,
            "Invalid scrypt parameters (n must be a power of two > 1, r and p positive)");
    }

    if (salt.size() < KDF_SALT_SIZE) {
        return core::VaultResult(core::VaultError::KEY_DERIVATION_FAILED, "Salt too short");
    }

    int rc = crypto_pwhash_scryptsalsa208sha256_ll(
        reinterpret_cast<const std::uint8_t*>(password.data()), password.size(),
        salt.data(), salt.size(),
        params.n, params.r, params.p,
        out_key.data(), SymmetricKey::size());

    if (rc != 0) {
        LOG_WARN("scrypt failed (n={}, r={}, p={})", params.n, params.r, params.p);
        return core::VaultResult(core::VaultError::KEY_DERIVATION_FAILED,
            "scrypt key derivation failed (insufficient memory or bad parameters)");
    }

    return core::VaultResult();
}

std::string KeyDerivation::key_check(const SymmetricKey& key) {
    auto digest = Blake2bHasher::hash_keyed(key.span(), as_bytes(KEY_CHECK_CONTEXT));
    return hash_utils::to_hex(std::span(digest.data(), KEY_CHECK_SIZE));
}

}
