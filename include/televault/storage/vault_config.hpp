#pragma once

#include "televault/core/config.hpp"
#include "televault/core/result.hpp"
#include "televault/crypto/key_derivation.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>

namespace televault::storage {

// Typed settings handed to the core. Built once from the flat Config by the
// command-line layer; nothing below that layer reads Config directly.
struct VaultConfig {
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 100ULL * 1024 * 1024;  // 100MB
    static constexpr uint64_t MAX_CHUNK_SIZE = 2000ULL * 1024 * 1024;     // ~2GB with margin

    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    bool compression = true;
    bool encryption = true;

    int parallel_uploads = 3;
    int parallel_downloads = 5;
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds chunk_timeout{300000};

    int catalog_max_retries = 8;
    crypto::KdfParams kdf;

    std::filesystem::path data_dir = ".televault";
    std::filesystem::path vault_directory = "televault_store";

    static VaultConfig from_config(const core::Config& config);

    // CONFIG_INVALID for nonsensical values, CHUNK_SIZE_EXCEEDS_LIMIT when a
    // chunk could not fit in one blob of the target channel.
    core::VaultResult validate(uint64_t channel_max_blob_size) const;

    std::filesystem::path progress_db_path() const { return data_dir / "progress.db"; }
};

} // namespace televault::storage
