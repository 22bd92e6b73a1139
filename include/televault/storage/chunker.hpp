#pragma once

#include "televault/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <vector>

namespace televault::storage {

struct Chunk {
    uint64_t index = 0;
    std::vector<uint8_t> data;
};

struct ByteRange {
    uint64_t offset = 0;
    uint64_t length = 0;
};

// Deterministic mapping between chunk indices and byte ranges of a file.
// Chunk i always covers [i * chunk_size, min((i + 1) * chunk_size, file_size)).
class ChunkLayout {
public:
    ChunkLayout() = default;
    ChunkLayout(uint64_t file_size, uint64_t chunk_size);

    uint64_t file_size() const { return file_size_; }
    uint64_t chunk_size() const { return chunk_size_; }
    uint64_t chunk_count() const { return chunk_count_; }

    bool contains(uint64_t index) const { return index < chunk_count_; }

    // Throws std::out_of_range for an index outside [0, chunk_count).
    ByteRange range(uint64_t index) const;

private:
    uint64_t file_size_ = 0;
    uint64_t chunk_size_ = 1;
    uint64_t chunk_count_ = 0;
};

// Splits a file into chunks, holding at most one chunk in memory per call.
// next() walks the file in order; read() regenerates any chunk by seeking,
// which is what lets an interrupted upload restart at an arbitrary index.
class ChunkReader {
public:
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 100ULL * 1024 * 1024; // 100MB

    ChunkReader(const std::filesystem::path& file_path, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    core::VaultResult open();

    bool is_open() const { return stream_.is_open(); }
    const ChunkLayout& layout() const { return layout_; }

    bool has_next() const { return cursor_ < layout_.chunk_count(); }
    core::VaultResult next(Chunk& out);

    // Safe to call from several workers at once.
    core::VaultResult read(uint64_t index, std::vector<uint8_t>& out);

    // In-memory equivalent of iterating next() over a buffer.
    static std::vector<Chunk> split(std::span<const uint8_t> data, uint64_t chunk_size);

private:
    std::filesystem::path file_path_;
    uint64_t chunk_size_;
    ChunkLayout layout_;
    uint64_t cursor_ = 0;

    std::ifstream stream_;
    std::mutex stream_mutex_;
};

} // namespace televault::storage
