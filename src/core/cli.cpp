#include "televault/core/cli.hpp"
#include "televault/core/utils.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace televault::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.config/televault/televault.conf");
    add_option("", "verbose", "Enable debug logging");

    add_option("p", "password", "Encryption password (or TELEVAULT_PASSWORD)", true);
    add_option("o", "output", "Destination path for pull", true);
    add_option("", "no-compress", "Store chunks uncompressed");
    add_option("", "no-encrypt", "Store chunks unencrypted");
    add_option("", "chunk-size", "Chunk size, e.g. 64M (at most 2000M)", true);
    add_option("j", "parallel", "Concurrent chunk transfers", true);

    add_option("", "json", "Print the listing as JSON");
    add_option("", "sort", "Sort the listing by name, size or date", true, "name");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    const std::string& key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{key, description, has_value, default_value};
    if (!short_name.empty()) {
        short_to_long_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    std::vector<std::string> args(argv + 1, argv + argc);
    size_t i = 0;

    // Consumes the value of `name` from `inline_value` or the next argument.
    auto take_value = [&](const std::string& name, const std::string& shown,
                          std::optional<std::string> inline_value) {
        if (inline_value) {
            parsed_options_[name] = *inline_value;
            return true;
        }
        if (i + 1 >= args.size()) {
            error_ = "Option " + shown + " requires a value";
            return false;
        }
        parsed_options_[name] = args[++i];
        return true;
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), args.begin() + i + 1, args.end());
            break;
        }

        if (arg.size() > 2 && arg.starts_with("--")) {
            auto body = arg.substr(2);
            std::optional<std::string> inline_value;
            if (auto eq_pos = body.find('='); eq_pos != std::string::npos) {
                inline_value = body.substr(eq_pos + 1);
                body.resize(eq_pos);
            }

            auto it = options_.find(body);
            if (it == options_.end()) {
                error_ = "Unknown option: --" + body;
                return false;
            }
            if (!it->second.has_value) {
                if (inline_value) {
                    error_ = "Option --" + body + " does not take a value";
                    return false;
                }
                parsed_options_[body] = "true";
            } else if (!take_value(body, "--" + body, inline_value)) {
                return false;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            // Flags may be bundled (-vh); a value option ends the bundle and
            // takes the rest of the argument (-j4) or the next one.
            for (size_t j = 1; j < arg.size(); ++j) {
                std::string short_opt(1, arg[j]);
                auto long_it = short_to_long_.find(short_opt);
                if (long_it == short_to_long_.end()) {
                    error_ = "Unknown option: -" + short_opt;
                    return false;
                }

                const auto& name = long_it->second;
                if (!options_.at(name).has_value) {
                    parsed_options_[name] = "true";
                    continue;
                }
                std::optional<std::string> rest;
                if (j + 1 < arg.size()) {
                    rest = arg.substr(j + 1);
                }
                if (!take_value(name, "-" + short_opt, rest)) {
                    return false;
                }
                break;
            }
            continue;
        }

        positional_args_.push_back(arg);
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) != 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto key = normalize_option_name(name);
    if (auto it = parsed_options_.find(key); it != parsed_options_.end()) {
        return it->second;
    }
    if (auto it = options_.find(key); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    if (value.empty()) return default_value;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : default_value;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes";
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    std::map<std::string, std::string> long_to_short;
    for (const auto& [short_name, long_name] : short_to_long_) {
        long_to_short[long_name] = short_name;
    }

    for (const auto& [name, option] : options_) {
        std::string flag = "--" + name;
        if (auto it = long_to_short.find(name); it != long_to_short.end()) {
            flag = "-" + it->second + ", " + flag;
        }
        if (option.has_value) {
            flag += " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flag << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 0.1.0\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
