#include "televault/crypto/hash.hpp"
#include "televault/crypto/random.hpp"
#include <sodium.h>
#include <fstream>

namespace televault::crypto {

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

core::VaultResult Blake2bHasher::initialize(std::span<const std::uint8_t> key) {
    SecureRandom::initialize();

    if (!key.empty() && (key.size() < crypto_generichash_KEYBYTES_MIN ||
                         key.size() > crypto_generichash_KEYBYTES_MAX)) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT, "Invalid hash key length");
    }

    if (crypto_generichash_init(&impl_->state,
                                key.empty() ? nullptr : key.data(), key.size(),
                                CONTENT_HASH_SIZE) != 0) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Failed to initialize hasher");
    }

    initialized_ = true;
    return core::VaultResult();
}

core::VaultResult Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Failed to update hash");
    }

    return core::VaultResult();
}

core::VaultResult Blake2bHasher::finalize(ContentHash& output) {
    if (!initialized_) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return core::VaultResult();
}

ContentHash Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    SecureRandom::initialize();
    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

ContentHash Blake2bHasher::hash_keyed(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    SecureRandom::initialize();
    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), key.data(), key.size());
    return result;
}

core::VaultResult Blake2bHasher::hash_file(const std::filesystem::path& file_path, ContentHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::VaultResult(core::VaultError::IO_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Blake2bHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 1024 * 1024;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return core::VaultResult(core::VaultError::IO_ERROR, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(output);
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string) {
    if (hex_string.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> bytes(hex_string.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, &end) != 0 ||
        bin_len != bytes.size() || end != hex_string.data() + hex_string.size()) {
        return std::nullopt;
    }
    return bytes;
}

std::string hash_to_hex(const ContentHash& hash) {
    return to_hex(std::span(hash));
}

std::string hash_hex(std::span<const std::uint8_t> data) {
    return hash_to_hex(Blake2bHasher::hash(data));
}

}

}
