#include "televault/storage/chunker.hpp"
#include "televault/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace televault::storage {

ChunkLayout::ChunkLayout(uint64_t file_size, uint64_t chunk_size)
    : file_size_(file_size), chunk_size_(chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    chunk_count_ = (file_size + chunk_size - 1) / chunk_size;
}

ByteRange ChunkLayout::range(uint64_t index) const {
    if (!contains(index)) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " outside [0, " + std::to_string(chunk_count_) + ")");
    }
    ByteRange r;
    r.offset = index * chunk_size_;
    r.length = std::min(chunk_size_, file_size_ - r.offset);
    return r;
}

ChunkReader::ChunkReader(const std::filesystem::path& file_path, uint64_t chunk_size)
    : file_path_(file_path), chunk_size_(chunk_size) {
}

core::VaultResult ChunkReader::open() {
    if (chunk_size_ == 0) {
        return core::VaultResult(core::VaultError::CONFIG_INVALID, "Chunk size must be positive");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path_, ec)) {
        return core::VaultResult(core::VaultError::IO_ERROR,
            "Not a regular file: " + file_path_.string());
    }
    auto file_size = std::filesystem::file_size(file_path_, ec);
    if (ec) {
        return core::VaultResult(core::VaultError::IO_ERROR,
            "Cannot stat " + file_path_.string() + ": " + ec.message());
    }

    stream_.open(file_path_, std::ios::binary);
    if (!stream_.is_open()) {
        return core::VaultResult(core::VaultError::IO_ERROR,
            "Cannot open " + file_path_.string());
    }

    layout_ = ChunkLayout(file_size, chunk_size_);
    cursor_ = 0;
    LOG_DEBUG("Opened {} ({} bytes, {} chunks of {})",
              file_path_.string(), file_size, layout_.chunk_count(), chunk_size_);
    return core::VaultResult();
}

core::VaultResult ChunkReader::next(Chunk& out) {
    if (!has_next()) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "No more chunks");
    }
    out.index = cursor_;
    auto status = read(cursor_, out.data);
    if (status) {
        ++cursor_;
    }
    return status;
}

core::VaultResult ChunkReader::read(uint64_t index, std::vector<uint8_t>& out) {
    if (!stream_.is_open()) {
        return core::VaultResult(core::VaultError::INVALID_STATE, "Reader is not open");
    }
    if (!layout_.contains(index)) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT,
            "Chunk index out of range").at_chunk(index);
    }

    auto r = layout_.range(index);
    out.resize(static_cast<size_t>(r.length));

    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(r.offset));
    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(r.length));
    if (static_cast<uint64_t>(stream_.gcount()) != r.length) {
        out.clear();
        return core::VaultResult(core::VaultError::IO_ERROR,
            "Short read from " + file_path_.string()).at_chunk(index);
    }
    return core::VaultResult();
}

std::vector<Chunk> ChunkReader::split(std::span<const uint8_t> data, uint64_t chunk_size) {
    ChunkLayout layout(data.size(), chunk_size);
    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<size_t>(layout.chunk_count()));
    for (uint64_t i = 0; i < layout.chunk_count(); ++i) {
        auto r = layout.range(i);
        auto part = data.subspan(static_cast<size_t>(r.offset), static_cast<size_t>(r.length));
        chunks.push_back(Chunk{i, std::vector<uint8_t>(part.begin(), part.end())});
    }
    return chunks;
}

} // namespace televault::storage
