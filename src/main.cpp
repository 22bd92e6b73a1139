#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "televault/core/logger.hpp"
#include "televault/core/config.hpp"
#include "televault/core/cli.hpp"
#include "televault/core/utils.hpp"
#include "televault/core/command_registry.hpp"

namespace {

televault::core::CommandContext* g_context = nullptr;

void handle_interrupt(int) {
    if (g_context) {
        g_context->cancel();
    }
}

}

int main(int argc, char* argv[]) {
    televault::core::CommandLineParser parser("televault");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 2;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    using televault::core::utils::FileUtils;

    auto& config = televault::core::Config::instance();
    config.set_defaults();

    auto config_file = FileUtils::expand_user(parser.get_option("config"));
    if (FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Error: malformed configuration file " << config_file.string() << "\n";
        return 2;
    }
    config.apply_environment();

    auto log_level = parser.has_option("verbose") ?
        televault::core::LogLevel::Debug :
        televault::core::parse_log_level(config.get_string("log.level"));
    auto log_file = config.get_string("log.file");
    televault::core::Logger::initialize(log_file.empty() ? "" : FileUtils::expand_user(log_file).string(), log_level);

    LOG_DEBUG("TeleVault starting up");

    televault::core::CommandOptions options;
    options.password = parser.get_option("password");
    if (options.password.empty()) {
        if (const char* env = std::getenv("TELEVAULT_PASSWORD")) {
            options.password = env;
        }
    }
    options.output = parser.get_option("output");
    options.no_compress = parser.has_option("no-compress");
    options.no_encrypt = parser.has_option("no-encrypt");
    options.chunk_size = parser.get_option("chunk-size");
    options.parallel = parser.get_int_option("parallel", 0);
    options.json = parser.has_option("json");
    options.sort = parser.get_option("sort", "name");

    auto context = std::make_shared<televault::core::CommandContext>(config, options);
    televault::core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        televault::core::Logger::shutdown();
        return 0;
    }

    g_context = context.get();
    std::signal(SIGINT, handle_interrupt);

    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);

    std::signal(SIGINT, SIG_DFL);
    g_context = nullptr;

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    }

    televault::core::Logger::shutdown();
    return result.exit_code;
}
