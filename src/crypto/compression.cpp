#include "televault/crypto/compression.hpp"
#include "televault/core/utils.hpp"
#include <zstd.h>
#include <filesystem>
#include <unordered_set>

namespace televault::crypto {

namespace {
    const std::unordered_set<std::string>& incompressible_extensions() {
        static const std::unordered_set<std::string> extensions = {
            // Images
            ".jpg", ".jpeg", ".png", ".gif", ".webp", ".heic", ".heif", ".avif",
            // Video
            ".mp4", ".mkv", ".avi", ".mov", ".webm", ".m4v", ".wmv", ".flv",
            // Audio
            ".mp3", ".aac", ".ogg", ".opus", ".flac", ".m4a", ".wma",
            // Archives
            ".zip", ".gz", ".bz2", ".xz", ".7z", ".rar", ".zst", ".lz4", ".lzma",
            // Documents
            ".pdf", ".docx", ".xlsx", ".pptx", ".odt",
            // Other
            ".woff", ".woff2", ".br",
        };
        return extensions;
    }
}

bool Compressor::should_compress(const std::string& filename) {
    auto extension = core::utils::FileUtils::get_file_extension(std::filesystem::path(filename));
    return incompressible_extensions().count(extension) == 0;
}

std::uint64_t Compressor::max_compressed_size(std::uint64_t input_size) {
    return ZSTD_compressBound(static_cast<size_t>(input_size));
}

core::VaultResult Compressor::compress(std::span<const std::uint8_t> input,
                                       std::vector<std::uint8_t>& output,
                                       int level) {
    output.resize(ZSTD_compressBound(input.size()));

    size_t compressed_size = ZSTD_compress(output.data(), output.size(),
                                           input.data(), input.size(), level);
    if (ZSTD_isError(compressed_size)) {
        output.clear();
        return core::VaultResult(core::VaultError::COMPRESSION_FAILED,
            std::string("zstd compression failed: ") + ZSTD_getErrorName(compressed_size));
    }

    output.resize(compressed_size);
    return core::VaultResult();
}

core::VaultResult Compressor::decompress(std::span<const std::uint8_t> input,
                                         std::uint64_t expected_size,
                                         std::vector<std::uint8_t>& output) {
    unsigned long long frame_size = ZSTD_getFrameContentSize(input.data(), input.size());
    if (frame_size == ZSTD_CONTENTSIZE_ERROR) {
        return core::VaultResult(core::VaultError::COMPRESSION_FAILED, "Input is not a zstd frame");
    }
    if (frame_size != ZSTD_CONTENTSIZE_UNKNOWN && frame_size != expected_size) {
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "zstd frame declares " + std::to_string(frame_size) +
            " bytes, expected " + std::to_string(expected_size));
    }

    output.resize(static_cast<size_t>(expected_size));
    size_t decompressed_size = ZSTD_decompress(output.data(), output.size(),
                                               input.data(), input.size());
    if (ZSTD_isError(decompressed_size)) {
        output.clear();
        return core::VaultResult(core::VaultError::COMPRESSION_FAILED,
            std::string("zstd decompression failed: ") + ZSTD_getErrorName(decompressed_size));
    }
    if (decompressed_size != expected_size) {
        output.clear();
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Decompressed " + std::to_string(decompressed_size) +
            " bytes, expected " + std::to_string(expected_size));
    }

    return core::VaultResult();
}

}
