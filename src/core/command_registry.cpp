#include "televault/core/command_registry.hpp"
#include "televault/core/utils.hpp"
#include <iostream>
#include <iomanip>

namespace televault::core {

CommandRegistry::CommandRegistry(std::shared_ptr<CommandContext> context) {
    register_command("push", std::make_unique<PushCommandHandler>(context));
    register_command("pull", std::make_unique<PullCommandHandler>(context));
    register_command("ls", std::make_unique<ListCommandHandler>(context));
    register_command("info", std::make_unique<InfoCommandHandler>(context));
    register_command("search", std::make_unique<SearchCommandHandler>(context));
    register_command("rm", std::make_unique<RemoveCommandHandler>(context));
    register_command("status", std::make_unique<StatusCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (handlers_.find(name) == handlers_.end()) {
        order_.push_back(name);
    }
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command +
                                    " (expected one of: " + utils::StringUtils::join(order_, ", ") + ")", 2);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) != 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& name : order_) {
        const auto& handler = handlers_.at(name);
        std::cout << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
                  << "  " << std::setw(10) << "" << handler->get_usage() << "\n";
    }
}

}
