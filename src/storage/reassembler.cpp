#include "televault/storage/reassembler.hpp"

namespace televault::storage {

Reassembler::Reassembler(const ChunkLayout& layout, Sink sink)
    : layout_(layout), sink_(std::move(sink)) {
}

core::VaultResult Reassembler::add(uint64_t index, std::vector<uint8_t> data) {
    if (!layout_.contains(index)) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT,
            "Chunk index outside [0, " + std::to_string(layout_.chunk_count()) + ")").at_chunk(index);
    }
    if (index < next_index_ || pending_.count(index) != 0) {
        return core::VaultResult();
    }

    auto expected = layout_.range(index).length;
    if (data.size() != expected) {
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Chunk holds " + std::to_string(data.size()) +
            " bytes, expected " + std::to_string(expected)).at_chunk(index);
    }

    pending_.emplace(index, std::move(data));
    return flush_ready();
}

core::VaultResult Reassembler::flush_ready() {
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == next_index_) {
        auto status = sink_(std::span<const uint8_t>(it->second));
        if (!status) {
            return status.at_chunk(next_index_);
        }
        bytes_written_ += it->second.size();
        ++next_index_;
        it = pending_.erase(it);
    }
    return core::VaultResult();
}

core::VaultResult Reassembler::finish() const {
    if (!complete()) {
        return core::VaultResult(core::VaultError::INCOMPLETE_SEQUENCE,
            "Missing chunk " + std::to_string(next_index_) + " of " +
            std::to_string(layout_.chunk_count())).at_chunk(next_index_);
    }
    if (bytes_written_ != layout_.file_size()) {
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Reassembled " + std::to_string(bytes_written_) +
            " bytes, expected " + std::to_string(layout_.file_size()));
    }
    return core::VaultResult();
}

core::VaultResult Reassembler::join(const std::vector<Chunk>& chunks,
                                    const ChunkLayout& layout,
                                    std::vector<uint8_t>& out) {
    std::map<uint64_t, const Chunk*> by_index;
    for (const auto& chunk : chunks) {
        by_index.emplace(chunk.index, &chunk);
    }

    out.clear();
    uint64_t total = 0;
    for (uint64_t i = 0; i < layout.chunk_count(); ++i) {
        auto it = by_index.find(i);
        if (it == by_index.end()) {
            out.clear();
            return core::VaultResult(core::VaultError::INCOMPLETE_SEQUENCE,
                "Missing chunk " + std::to_string(i)).at_chunk(i);
        }
        total += it->second->data.size();
    }
    if (by_index.size() > layout.chunk_count()) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT,
            "Chunk set holds indices beyond the layout");
    }
    if (total != layout.file_size()) {
        return core::VaultResult(core::VaultError::SIZE_MISMATCH,
            "Joined " + std::to_string(total) + " bytes, expected " +
            std::to_string(layout.file_size()));
    }

    out.reserve(static_cast<size_t>(total));
    for (const auto& [index, chunk] : by_index) {
        out.insert(out.end(), chunk->data.begin(), chunk->data.end());
    }
    return core::VaultResult();
}

} // namespace televault::storage
