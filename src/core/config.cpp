#include "televault/core/config.hpp"
#include "televault/core/utils.hpp"
#include <cstdlib>

namespace televault::core {

namespace {

using utils::StringUtils;

// A '#' or ';' starts a comment unless it sits inside a value without
// preceding whitespace, so "pass#word" survives but "3  # retries" does not.
std::string strip_comment(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if ((line[i] == '#' || line[i] == ';') && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = StringUtils::trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return false;
            }
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            return false;
        }

        auto key = StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            return false;
        }
        if (!section.empty() && key.find('.') == std::string::npos) {
            key = section + "." + key;
        }
        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    }

    return !file.bad();
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# TeleVault configuration\n";

    // Unqualified keys must precede the first header or they would reload
    // into whichever section came last.
    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }

    std::string current;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        auto section = key.substr(0, dot);
        if (section != current) {
            current = section;
            file << "\n[" << section << "]\n";
        }
        file << key.substr(dot + 1) << " = " << value << "\n";
    }

    return file.good();
}

std::string Config::environment_name(const std::string& prefix, const std::string& key) {
    auto name = StringUtils::to_upper(key);
    for (auto& c : name) {
        if (c == '.') c = '_';
    }
    return prefix + name;
}

int Config::apply_environment(const std::string& prefix) {
    int applied = 0;
    for (auto& [key, value] : values_) {
        if (const char* env = std::getenv(environment_name(prefix, key).c_str())) {
            value = env;
            ++applied;
        }
    }
    return applied;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

double Config::get_double(const std::string& key, double default_value) const {
    return get_as<double>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_ = {
        {"transfer.chunk_size", "100M"},
        {"transfer.compression", "true"},
        {"transfer.encryption", "true"},
        {"transfer.parallel_uploads", "3"},
        {"transfer.parallel_downloads", "5"},
        {"transfer.max_retries", "3"},
        {"transfer.retry_delay", "1.0"},
        {"transfer.chunk_timeout", "300"},
        {"catalog.max_retries", "8"},
        {"kdf.n", "131072"},
        {"kdf.r", "8"},
        {"kdf.p", "1"},
        {"vault.directory", "~/.local/share/televault/store"},
        {"vault.data_dir", "~/.local/share/televault"},
        {"log.level", "info"},
        {"log.file", "~/.local/share/televault/televault.log"},
    };
}

}
