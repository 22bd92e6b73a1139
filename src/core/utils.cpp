#include "televault/core/utils.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace televault::core::utils {

namespace {

bool is_space(unsigned char c) { return std::isspace(c) != 0; }

std::filesystem::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return ".";
}

}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += delimiter;
        joined += parts[i];
    }
    return joined;
}

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return start < end ? std::string(start, end) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool StringUtils::contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    static constexpr std::array<const char*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    for (; size >= 1024.0 && unit + 1 < units.size(); ++unit) {
        size /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

std::optional<uint64_t> StringUtils::parse_size(const std::string& str) {
    auto value = trim(str);
    if (value.empty()) return std::nullopt;

    unsigned shift = 0;
    switch (std::toupper(static_cast<unsigned char>(value.back()))) {
        case 'K': shift = 10; break;
        case 'M': shift = 20; break;
        case 'G': shift = 30; break;
        default: break;
    }
    if (shift != 0) {
        value.pop_back();
    }

    uint64_t count = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, count);
    if (value.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    if (count > (UINT64_MAX >> shift)) {
        return std::nullopt;
    }
    return count << shift;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

// Raw file-clock ticks; only compared against earlier readings of the same file.
std::optional<int64_t> FileUtils::modification_time(const std::filesystem::path& path) {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return static_cast<int64_t>(time.time_since_epoch().count());
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::optional<std::vector<uint8_t>> FileUtils::read_binary(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
    if (file.bad()) return std::nullopt;
    return content;
}

bool FileUtils::write_binary_atomic(const std::filesystem::path& path, std::span<const uint8_t> data) {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good()) return false;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return StringUtils::to_lower(path.extension().string());
}

std::filesystem::path FileUtils::expand_user(const std::string& path) {
    if (path == "~") {
        return home_directory();
    }
    if (path.rfind("~/", 0) == 0) {
        return home_directory() / path.substr(2);
    }
    return path;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

double TimeUtils::to_unix_seconds(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_seconds(double seconds) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(seconds)));
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}
