#include "televault/core/command_handler.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include "televault/remote/directory_channel.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <thread>

namespace televault::core {

using utils::StringUtils;
using utils::TimeUtils;

namespace {

// Prints one status line per chunk event while a transfer runs.
class ProgressPrinter {
public:
    explicit ProgressPrinter(std::shared_ptr<transfer::ProgressStream> stream)
        : stream_(std::move(stream)) {
        if (stream_) {
            worker_ = std::thread([this] { run(); });
        }
    }

    ~ProgressPrinter() {
        stop_ = true;
        if (worker_.joinable()) {
            worker_.join();
        }
        if (printed_) {
            std::cout << "\n";
        }
    }

private:
    std::shared_ptr<transfer::ProgressStream> stream_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    bool printed_ = false;

    void run() {
        while (!stop_) {
            auto event = stream_->wait_next(std::chrono::milliseconds(100));
            while (event) {
                print(*event);
                event = stream_->wait_next(std::chrono::milliseconds(0));
            }
        }
    }

    void print(const transfer::ProgressEvent& event) {
        if (event.status == transfer::ChunkStatus::STARTED) {
            return;
        }
        std::cout << "\r  " << (event.direction == transfer::TransferDirection::UPLOAD ? "Uploading" : "Downloading")
                  << " chunk " << event.chunks_done << "/" << event.total_chunks
                  << " [" << std::fixed << std::setprecision(1) << event.percentage() << "%] "
                  << transfer::to_string(event.status) << "   " << std::flush;
        printed_ = true;
    }
};

std::string short_id(const std::string& file_id) {
    return file_id.substr(0, std::min<size_t>(8, file_id.size()));
}

}

CommandResult CommandResult::from(const VaultResult& result) {
    if (result) {
        return ok();
    }
    switch (result.error) {
        case VaultError::INVALID_ARGUMENT:
        case VaultError::CONFIG_INVALID:
        case VaultError::CHUNK_SIZE_EXCEEDS_LIMIT:
        case VaultError::MISSING_CREDENTIALS:
            return error(result.describe(), 2);
        default:
            return error(result.describe(), 1);
    }
}

CommandContext::CommandContext(const Config& config, CommandOptions options,
                               std::shared_ptr<remote::RemoteChannel> channel)
    : config_(config)
    , options_(std::move(options))
    , channel_(std::move(channel))
    , progress_(std::make_shared<transfer::ProgressStream>())
    , cancel_(std::make_shared<transfer::CancellationToken>()) {
}

VaultResult CommandContext::vault_config(storage::VaultConfig& out) const {
    out = storage::VaultConfig::from_config(config_);

    if (!options_.chunk_size.empty()) {
        auto size = StringUtils::parse_size(options_.chunk_size);
        if (!size) {
            return VaultResult(VaultError::CONFIG_INVALID, "Invalid chunk size: " + options_.chunk_size);
        }
        out.chunk_size = *size;
    }
    if (options_.no_compress) {
        out.compression = false;
    }
    if (options_.no_encrypt) {
        out.encryption = false;
    }
    if (options_.parallel > 0) {
        out.parallel_uploads = options_.parallel;
        out.parallel_downloads = options_.parallel;
    }
    return VaultResult();
}

VaultResult CommandContext::open_vault(Vault*& out) {
    if (vault_) {
        out = vault_.get();
        return VaultResult();
    }

    storage::VaultConfig vault_config;
    auto status = this->vault_config(vault_config);
    if (!status) {
        return status.in_operation("open");
    }

    auto channel = channel_;
    if (!channel) {
        auto directory = std::make_shared<remote::DirectoryChannel>(vault_config.vault_directory);
        status = directory->open();
        if (!status) {
            return status.in_operation("open");
        }
        channel = directory;
    }

    auto vault = std::make_unique<Vault>(channel, vault_config, progress_, cancel_);
    status = vault->open();
    if (!status) {
        return status;
    }

    vault_ = std::move(vault);
    out = vault_.get();
    return VaultResult();
}

CommandResult PushCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage(), 2);
    }

    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string(), 2);
    }

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    LOG_INFO("Pushing {}", file_path.string());
    std::cout << "Uploading " << file_path.filename().string() << "\n";

    transfer::UploadOutcome outcome;
    {
        ProgressPrinter printer(context_->progress());
        status = vault->push(file_path, context_->options().password, outcome);
    }
    if (!status) {
        return CommandResult::from(status);
    }

    const auto& record = outcome.record;
    std::cout << "✓ Uploaded " << record.name << "\n";
    std::cout << "  File ID: " << record.file_id << "\n";
    std::cout << "  Size: " << StringUtils::format_bytes(record.size) << "\n";
    std::cout << "  Chunks: " << record.chunk_count();
    if (outcome.resumed) {
        std::cout << " (" << outcome.chunks_skipped << " already stored, resumed)";
    }
    std::cout << "\n";
    std::cout << "  Encrypted: " << (record.encrypted ? "yes" : "no") << "\n";
    if (record.compressed) {
        std::cout << "  Compression: " << std::fixed << std::setprecision(1)
                  << record.compression_ratio() * 100.0 << "%\n";
    }
    return CommandResult::ok("File uploaded");
}

CommandResult PullCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage(), 2);
    }

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    LOG_INFO("Pulling {}", args[1]);

    std::filesystem::path written_to;
    {
        ProgressPrinter printer(context_->progress());
        status = vault->pull(args[1], context_->options().output, context_->options().password, &written_to);
    }
    if (!status) {
        return CommandResult::from(status);
    }

    std::cout << "✓ Downloaded to " << written_to.string() << "\n";
    return CommandResult::ok("File downloaded");
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    std::vector<storage::FileRecord> files;
    status = vault->list(files);
    if (!status) {
        return CommandResult::from(status);
    }

    const auto& sort = context_->options().sort;
    if (sort == "size") {
        std::sort(files.begin(), files.end(),
                  [](const auto& a, const auto& b) { return a.size > b.size; });
    } else if (sort == "date") {
        std::sort(files.begin(), files.end(),
                  [](const auto& a, const auto& b) { return a.created_at > b.created_at; });
    } else if (sort == "name") {
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return StringUtils::to_lower(a.name) < StringUtils::to_lower(b.name);
        });
    } else {
        return CommandResult::error("Unknown sort key: " + sort, 2);
    }

    if (context_->options().json) {
        auto output = nlohmann::json::array();
        for (const auto& file : files) {
            output.push_back({{"id", file.file_id}, {"name", file.name}, {"size", file.size}});
        }
        std::cout << output.dump(2) << "\n";
        return CommandResult::ok();
    }

    if (files.empty()) {
        std::cout << "No files in vault\n";
        return CommandResult::ok();
    }

    uint64_t total_size = 0;
    std::cout << std::left << std::setw(10) << "ID" << std::setw(32) << "Name"
              << std::right << std::setw(12) << "Size" << std::setw(8) << "Chunks" << "  Encrypted\n";
    for (const auto& file : files) {
        std::cout << std::left << std::setw(10) << short_id(file.file_id) << std::setw(32) << file.name
                  << std::right << std::setw(12) << StringUtils::format_bytes(file.size)
                  << std::setw(8) << file.chunk_count()
                  << "  " << (file.encrypted ? "yes" : "no") << "\n";
        total_size += file.size;
    }
    std::cout << "\n" << files.size() << " file(s), " << StringUtils::format_bytes(total_size) << " total\n";
    return CommandResult::ok();
}

CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage(), 2);
    }

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    storage::FileRecord file;
    status = vault->info(args[1], file);
    if (!status) {
        return CommandResult::from(status);
    }

    std::cout << file.name << "\n\n";
    std::cout << "  ID:          " << file.file_id << "\n";
    std::cout << "  Size:        " << StringUtils::format_bytes(file.size) << "\n";
    std::cout << "  Hash:        " << file.content_hash << "\n";
    std::cout << "  Chunks:      " << file.chunk_count() << "\n";
    std::cout << "  Encrypted:   " << (file.encrypted ? "yes" : "no") << "\n";
    std::cout << "  Compressed:  " << (file.compressed ? "yes" : "no") << "\n";
    if (file.compressed) {
        std::cout << "  Comp. ratio: " << std::fixed << std::setprecision(1)
                  << file.compression_ratio() * 100.0 << "%\n";
    }
    if (!file.mime_type.empty()) {
        std::cout << "  MIME type:   " << file.mime_type << "\n";
    }
    std::cout << "  Created:     " << TimeUtils::format_timestamp(file.created_at) << "\n";
    std::cout << "  Stored size: " << StringUtils::format_bytes(file.stored_size()) << "\n";
    return CommandResult::ok();
}

CommandResult SearchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage(), 2);
    }

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    std::vector<storage::FileRecord> files;
    status = vault->search(args[1], files);
    if (!status) {
        return CommandResult::from(status);
    }

    if (files.empty()) {
        std::cout << "No files matching '" << args[1] << "'\n";
    }
    for (const auto& file : files) {
        std::cout << short_id(file.file_id) << " " << file.name
                  << " (" << StringUtils::format_bytes(file.size) << ")\n";
    }
    return CommandResult::ok();
}

CommandResult RemoveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage(), 2);
    }

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    std::string removed_id;
    status = vault->remove(args[1], &removed_id);
    if (!status) {
        return CommandResult::from(status);
    }

    std::cout << "✓ Deleted: " << args[1] << " (" << removed_id << ")\n";
    return CommandResult::ok("File deleted");
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;

    Vault* vault = nullptr;
    auto status = context_->open_vault(vault);
    if (!status) {
        return CommandResult::from(status);
    }

    VaultStatus vault_status;
    status = vault->status(vault_status);
    if (!status) {
        return CommandResult::from(status);
    }

    std::cout << "TeleVault Status\n\n";
    std::cout << "  Vault: " << vault->config().vault_directory.string() << "\n";
    std::cout << "  Files: " << vault_status.file_count << "\n";
    std::cout << "  Total size: " << StringUtils::format_bytes(vault_status.total_size) << "\n";
    std::cout << "  Stored size: " << StringUtils::format_bytes(vault_status.stored_size) << "\n";
    std::cout << "  Compression ratio: " << std::fixed << std::setprecision(1)
              << vault_status.compression_ratio * 100.0 << "%\n";
    std::cout << "  Catalog version: " << vault_status.catalog_version << "\n";
    if (vault_status.unfinished_uploads > 0) {
        std::cout << "  Unfinished uploads: " << vault_status.unfinished_uploads
                  << " (push the same file again to resume)\n";
    }
    return CommandResult::ok();
}

}
