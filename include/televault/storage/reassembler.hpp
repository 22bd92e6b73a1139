#pragma once

#include "televault/storage/chunker.hpp"
#include "televault/core/result.hpp"
#include <functional>
#include <map>
#include <span>
#include <vector>

namespace televault::storage {

// Accepts decoded chunks in any order and writes them to the sink strictly in
// index order. Chunks that arrive ahead of the next expected index are held
// until the gap is filled.
class Reassembler {
public:
    using Sink = std::function<core::VaultResult(std::span<const uint8_t>)>;

    Reassembler(const ChunkLayout& layout, Sink sink);

    // A duplicate of an index that was already accepted is ignored.
    core::VaultResult add(uint64_t index, std::vector<uint8_t> data);

    // Fails with IncompleteSequence while any index is still missing and with
    // SizeMismatch if the bytes written differ from the layout's file size.
    core::VaultResult finish() const;

    uint64_t next_index() const { return next_index_; }
    uint64_t bytes_written() const { return bytes_written_; }
    size_t buffered_chunks() const { return pending_.size(); }
    bool complete() const { return next_index_ == layout_.chunk_count(); }

    // Joins a complete, gapless chunk set into one buffer.
    static core::VaultResult join(const std::vector<Chunk>& chunks,
                                  const ChunkLayout& layout,
                                  std::vector<uint8_t>& out);

private:
    ChunkLayout layout_;
    Sink sink_;
    std::map<uint64_t, std::vector<uint8_t>> pending_;
    uint64_t next_index_ = 0;
    uint64_t bytes_written_ = 0;

    core::VaultResult flush_ready();
};

} // namespace televault::storage
