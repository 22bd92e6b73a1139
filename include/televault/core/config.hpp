#pragma once

#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>

namespace televault::core {

// Flat key=value store backing the configuration file. Only the command-line
// layer reads it; core components receive a typed VaultConfig instead.
//
// The file format is INI-like: a `[transfer]` header prefixes the following
// keys with `transfer.`, and keys may also be written fully qualified.
class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    // Overrides every known key from `<prefix><SECTION>_<KEY>` environment
    // variables, e.g. TELEVAULT_TRANSFER_CHUNK_SIZE. Returns how many applied.
    int apply_environment(const std::string& prefix = "TELEVAULT_");
    static std::string environment_name(const std::string& prefix, const std::string& key);

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        iss >> result;
        if (iss.fail() || !iss.eof()) return std::nullopt;
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void clear() { values_.clear(); }
    void set_defaults();

    const std::map<std::string, std::string>& values() const { return values_; }

private:
    std::map<std::string, std::string> values_;
};

}
