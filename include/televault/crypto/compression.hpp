#pragma once

#include "televault/core/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace televault::crypto {

class Compressor {
public:
    static constexpr int DEFAULT_LEVEL = 3;

    // Static policy: files whose extension marks them as already-compressed
    // media or archives are stored as-is.
    static bool should_compress(const std::string& filename);

    static core::VaultResult compress(std::span<const std::uint8_t> input,
                                      std::vector<std::uint8_t>& output,
                                      int level = DEFAULT_LEVEL);

    // Largest frame compress() can produce for input_size bytes.
    static std::uint64_t max_compressed_size(std::uint64_t input_size);

    // expected_size bounds the output; a frame that decodes to any other
    // length is rejected.
    static core::VaultResult decompress(std::span<const std::uint8_t> input,
                                        std::uint64_t expected_size,
                                        std::vector<std::uint8_t>& output);
};

}
