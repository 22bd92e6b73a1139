#pragma once

#include "televault/core/config.hpp"
#include "televault/core/result.hpp"
#include "televault/core/vault.hpp"
#include "televault/remote/remote_channel.hpp"
#include "televault/storage/vault_config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace televault::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;

    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }

    // Usage errors exit with 2, everything else with 1.
    static CommandResult from(const VaultResult& result);
};

// Flags given on the command line for a single invocation. They take
// precedence over the configuration file.
struct CommandOptions {
    std::string password;
    std::string output;
    bool no_compress = false;
    bool no_encrypt = false;
    std::string chunk_size;
    int parallel = 0;
    bool json = false;
    std::string sort = "name";
};

// Shared by all handlers of one invocation: turns the flat Config plus the
// command-line flags into a ready Vault.
class CommandContext {
public:
    CommandContext(const Config& config, CommandOptions options,
                   std::shared_ptr<remote::RemoteChannel> channel = nullptr);

    const CommandOptions& options() const { return options_; }

    // Resolved VaultConfig, including per-invocation overrides.
    VaultResult vault_config(storage::VaultConfig& out) const;

    // Opens the channel (a DirectoryChannel at vault.directory unless one was
    // injected) and the Vault over it. The Vault is created once and reused.
    VaultResult open_vault(Vault*& out);

    std::shared_ptr<transfer::ProgressStream> progress() const { return progress_; }

    // Safe to call from a signal handler.
    void cancel() { cancel_->cancel(); }
    std::shared_ptr<transfer::CancellationToken> cancellation() const { return cancel_; }

private:
    const Config& config_;
    CommandOptions options_;
    std::shared_ptr<remote::RemoteChannel> channel_;
    std::shared_ptr<transfer::ProgressStream> progress_;
    std::shared_ptr<transfer::CancellationToken> cancel_;
    std::unique_ptr<Vault> vault_;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class VaultCommandHandler : public CommandHandler {
public:
    explicit VaultCommandHandler(std::shared_ptr<CommandContext> context)
        : context_(std::move(context)) {}

protected:
    std::shared_ptr<CommandContext> context_;
};

class PushCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a file to the vault"; }
    std::string get_usage() const override {
        return "televault push <file> [--password <pw>] [--no-compress] [--no-encrypt] [--chunk-size <size, e.g. 64M>]";
    }
};

class PullCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a file from the vault"; }
    std::string get_usage() const override {
        return "televault pull <file_id|name> [--output <path>] [--password <pw>]";
    }
};

class ListCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List files in the vault"; }
    std::string get_usage() const override { return "televault ls [--json] [--sort name|size|date]"; }
};

class InfoCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show detailed file information"; }
    std::string get_usage() const override { return "televault info <file_id|name>"; }
};

class SearchCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Search files by name"; }
    std::string get_usage() const override { return "televault search <query>"; }
};

class RemoveCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete a file from the vault"; }
    std::string get_usage() const override { return "televault rm <file_id|name>"; }
};

class StatusCommandHandler : public VaultCommandHandler {
public:
    using VaultCommandHandler::VaultCommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show vault status"; }
    std::string get_usage() const override { return "televault status"; }
};

}
