#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <span>
#include <cstdint>

namespace televault::core::utils {

class StringUtils {
public:
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static bool contains_ignore_case(const std::string& haystack, const std::string& needle);

    // "1.5 MB" style, binary multiples, one decimal.
    static std::string format_bytes(uint64_t bytes);
    // Byte count with an optional K/M/G binary suffix, e.g. "100M".
    static std::optional<uint64_t> parse_size(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static std::optional<int64_t> modification_time(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::optional<std::vector<uint8_t>> read_binary(const std::filesystem::path& path);

    // Writes to "<path>.tmp" and renames over `path`, so readers never see a
    // partial file.
    static bool write_binary_atomic(const std::filesystem::path& path, std::span<const uint8_t> data);
    static std::string get_file_extension(const std::filesystem::path& path);
    static std::filesystem::path expand_user(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static double to_unix_seconds(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_seconds(double seconds);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
