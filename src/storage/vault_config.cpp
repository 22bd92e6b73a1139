#include "televault/storage/vault_config.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/chunk_pipeline.hpp"

namespace televault::storage {

using core::utils::StringUtils;
using core::utils::FileUtils;

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

}

VaultConfig VaultConfig::from_config(const core::Config& config) {
    VaultConfig vc;

    if (auto chunk = config.get("transfer.chunk_size")) {
        // An unparsable size becomes 0 and is rejected by validate().
        vc.chunk_size = StringUtils::parse_size(*chunk).value_or(0);
    }
    vc.compression = config.get_bool("transfer.compression", vc.compression);
    vc.encryption = config.get_bool("transfer.encryption", vc.encryption);
    vc.parallel_uploads = config.get_int("transfer.parallel_uploads", vc.parallel_uploads);
    vc.parallel_downloads = config.get_int("transfer.parallel_downloads", vc.parallel_downloads);
    vc.max_retries = config.get_int("transfer.max_retries", vc.max_retries);
    vc.retry_delay = seconds_to_ms(config.get_double("transfer.retry_delay", 1.0));
    vc.chunk_timeout = seconds_to_ms(config.get_double("transfer.chunk_timeout", 300.0));
    vc.catalog_max_retries = config.get_int("catalog.max_retries", vc.catalog_max_retries);

    vc.kdf.n = config.get_as<uint64_t>("kdf.n").value_or(vc.kdf.n);
    vc.kdf.r = config.get_as<uint32_t>("kdf.r").value_or(vc.kdf.r);
    vc.kdf.p = config.get_as<uint32_t>("kdf.p").value_or(vc.kdf.p);

    vc.data_dir = FileUtils::expand_user(config.get_string("vault.data_dir", vc.data_dir.string()));
    vc.vault_directory = FileUtils::expand_user(config.get_string("vault.directory", vc.vault_directory.string()));
    return vc;
}

core::VaultResult VaultConfig::validate(uint64_t channel_max_blob_size) const {
    if (chunk_size == 0) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "chunk_size must be positive");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        return core::VaultResult(core::VaultError::CHUNK_SIZE_EXCEEDS_LIMIT,
            "chunk_size " + std::to_string(chunk_size) + " exceeds the limit of " +
            std::to_string(MAX_CHUNK_SIZE) + " bytes");
    }
    // The stored blob, not the plaintext chunk, has to fit the channel.
    auto sealed_size = crypto::ChunkPipeline::max_sealed_size(chunk_size, compression, encryption);
    if (sealed_size > channel_max_blob_size) {
        return core::VaultResult(core::VaultError::CHUNK_SIZE_EXCEEDS_LIMIT,
            "chunk_size " + std::to_string(chunk_size) + " seals to up to " + std::to_string(sealed_size) +
            " bytes, over the channel limit of " + std::to_string(channel_max_blob_size));
    }
    if (parallel_uploads < 1 || parallel_downloads < 1) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "parallelism must be at least 1");
    }
    if (max_retries < 0 || catalog_max_retries < 0) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "retry counts must not be negative");
    }
    if (retry_delay.count() < 0 || chunk_timeout.count() <= 0) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "retry_delay and chunk_timeout must be positive");
    }
    if (encryption && !kdf.valid()) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "invalid scrypt parameters");
    }
    return core::VaultResult();
}

} // namespace televault::storage
