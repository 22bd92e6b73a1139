#pragma once

#include "televault/crypto/crypto_types.hpp"
#include "televault/core/result.hpp"
#include <string>

namespace televault::crypto {

// scrypt cost parameters. Stored with every encrypted file so that changing
// the defaults never strands older uploads.
struct KdfParams {
    std::uint64_t n = 1ULL << 17;
    std::uint32_t r = 8;
    std::uint32_t p = 1;

    bool valid() const;
    bool operator==(const KdfParams& other) const = default;
};

class KeyDerivation {
public:
    static core::VaultResult derive_key(const std::string& password,
                                        std::span<const std::uint8_t> salt,
                                        const KdfParams& params,
                                        SymmetricKey& out_key);

    // Short keyed digest used to tell whether a stored resume record was
    // produced with the same key, without storing the key itself.
    static std::string key_check(const SymmetricKey& key);
};

}
