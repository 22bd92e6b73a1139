#pragma once

#include "televault/crypto/crypto_types.hpp"
#include "televault/core/result.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace televault::crypto {

// Streaming BLAKE2b-256 (libsodium generic hash).
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    core::VaultResult initialize(std::span<const std::uint8_t> key = {});
    core::VaultResult update(std::span<const std::uint8_t> data);
    core::VaultResult finalize(ContentHash& output);

    static ContentHash hash(std::span<const std::uint8_t> data);
    static ContentHash hash_keyed(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
    static core::VaultResult hash_file(const std::filesystem::path& file_path, ContentHash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string);

template<size_t N>
std::optional<std::array<std::uint8_t, N>> array_from_hex(const std::string& hex_string) {
    auto bytes = from_hex(hex_string);
    if (!bytes || bytes->size() != N) {
        return std::nullopt;
    }
    std::array<std::uint8_t, N> result;
    std::copy(bytes->begin(), bytes->end(), result.begin());
    return result;
}

std::string hash_to_hex(const ContentHash& hash);

std::string hash_hex(std::span<const std::uint8_t> data);

}

}
