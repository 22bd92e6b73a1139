#include "televault/core/vault.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"

namespace televault::core {

using utils::StringUtils;

Vault::Vault(std::shared_ptr<remote::RemoteChannel> channel,
             storage::VaultConfig config,
             std::shared_ptr<transfer::ProgressStream> progress,
             std::shared_ptr<transfer::CancellationToken> cancel)
    : channel_(std::move(channel))
    , config_(std::move(config))
    , progress_(std::move(progress))
    , cancel_(cancel ? std::move(cancel) : std::make_shared<transfer::CancellationToken>()) {
    catalog_ = std::make_shared<storage::CatalogManager>(
        channel_, storage::CatalogManager::DEFAULT_SLOT, config_.catalog_max_retries);
}

VaultResult Vault::open() {
    auto status = config_.validate(channel_->max_blob_size());
    if (!status) {
        return status.in_operation("open");
    }

    resume_ = std::make_shared<storage::ResumeManager>(config_.progress_db_path());
    if (!resume_->initialize()) {
        LOG_WARN("Resume store {} unavailable, interrupted uploads will start over",
                 config_.progress_db_path().string());
        resume_.reset();
    } else {
        resume_->cleanup_old_progress();
    }

    scheduler_ = std::make_unique<transfer::TransferScheduler>(channel_, catalog_, resume_, progress_);
    opened_ = true;
    return VaultResult();
}

VaultResult Vault::require_open(const std::string& operation) const {
    if (!opened_) {
        return VaultResult(VaultError::INVALID_STATE, "Vault is not open").in_operation(operation);
    }
    return VaultResult();
}

VaultResult Vault::push(const std::filesystem::path& path,
                        const std::string& password,
                        transfer::UploadOutcome& out) {
    if (auto closed = require_open("push"); !closed) {
        return closed;
    }
    transfer::UploadRequest request;
    request.source = path;
    request.password = password;
    request.options = transfer::TransferOptions::for_upload(config_);
    return scheduler_->upload(request, *cancel_, out);
}

VaultResult Vault::pull(const std::string& id_or_name,
                        const std::filesystem::path& output,
                        const std::string& password,
                        std::filesystem::path* written_to) {
    if (auto closed = require_open("pull"); !closed) {
        return closed;
    }

    transfer::DownloadRequest request;
    auto status = resolve(id_or_name, true, request.record);
    if (!status) {
        return status.in_operation("pull");
    }

    request.output = output.empty()
        ? std::filesystem::current_path() / std::filesystem::path(request.record.name).filename()
        : output;
    request.password = password;
    request.options = transfer::TransferOptions::for_download(config_);

    status = scheduler_->download(request, *cancel_);
    if (status && written_to) {
        *written_to = request.output;
    }
    return status;
}

VaultResult Vault::load_records(const storage::CatalogIndex& index, std::vector<storage::FileRecord>& out) {
    out.clear();
    out.reserve(index.files.size());
    for (const auto& [file_id, ref] : index.files) {
        storage::FileRecord record;
        auto status = catalog_->fetch_record(ref, record);
        if (!status) {
            LOG_WARN("Skipping {}: record {} unreadable ({})", file_id, ref, to_string(status.error));
            continue;
        }
        out.push_back(std::move(record));
    }
    return VaultResult();
}

VaultResult Vault::list(std::vector<storage::FileRecord>& out) {
    if (auto closed = require_open("ls"); !closed) {
        return closed;
    }
    storage::CatalogIndex index;
    auto status = catalog_->read(index);
    if (!status) {
        return status.in_operation("ls");
    }
    return load_records(index, out);
}

VaultResult Vault::info(const std::string& id_or_name, storage::FileRecord& out) {
    if (auto closed = require_open("info"); !closed) {
        return closed;
    }
    auto status = resolve(id_or_name, true, out);
    if (!status) {
        return status.in_operation("info");
    }
    return status;
}

VaultResult Vault::search(const std::string& query, std::vector<storage::FileRecord>& out) {
    if (auto closed = require_open("search"); !closed) {
        return closed;
    }
    std::vector<storage::FileRecord> all;
    auto status = list(all);
    if (!status) {
        return status.in_operation("search");
    }
    out.clear();
    for (auto& record : all) {
        if (StringUtils::contains_ignore_case(record.name, query)) {
            out.push_back(std::move(record));
        }
    }
    return VaultResult();
}

VaultResult Vault::remove(const std::string& id_or_name, std::string* removed_id) {
    if (auto closed = require_open("rm"); !closed) {
        return closed;
    }
    storage::FileRecord record;
    auto status = resolve(id_or_name, false, record);
    if (!status) {
        return status.in_operation("rm");
    }
    status = scheduler_->remove(record.file_id);
    if (status && removed_id) {
        *removed_id = record.file_id;
    }
    return status;
}

VaultResult Vault::status(VaultStatus& out) {
    if (auto closed = require_open("status"); !closed) {
        return closed;
    }
    storage::CatalogIndex index;
    auto result = catalog_->read(index);
    if (!result) {
        return result.in_operation("status");
    }
    std::vector<storage::FileRecord> records;
    result = load_records(index, records);
    if (!result) {
        return result.in_operation("status");
    }

    out = VaultStatus{};
    out.file_count = records.size();
    out.catalog_version = index.version;
    out.deleted_count = index.tombstones.size();
    for (const auto& record : records) {
        out.total_size += record.size;
        out.stored_size += record.stored_size();
    }
    out.compression_ratio = out.total_size > 0
        ? static_cast<double>(out.stored_size) / static_cast<double>(out.total_size)
        : 1.0;
    out.unfinished_uploads = resume_ ? resume_->get_progress_count() : 0;
    return VaultResult();
}

VaultResult Vault::resolve(const std::string& id_or_name, bool allow_partial, storage::FileRecord& out) {
    storage::CatalogIndex index;
    auto status = catalog_->read(index);
    if (!status) {
        return status;
    }

    if (auto ref = index.find(id_or_name)) {
        status = catalog_->fetch_record(*ref, out);
        return status ? status : status.for_file(id_or_name);
    }

    std::vector<storage::FileRecord> records;
    status = load_records(index, records);
    if (!status) {
        return status;
    }

    std::vector<const storage::FileRecord*> matches;
    for (const auto& record : records) {
        if (record.name == id_or_name) {
            matches.push_back(&record);
        }
    }
    if (matches.empty() && allow_partial) {
        for (const auto& record : records) {
            if (record.name.find(id_or_name) != std::string::npos) {
                matches.push_back(&record);
            }
        }
    }

    if (matches.empty()) {
        return VaultResult(VaultError::NOT_FOUND_IN_CATALOG,
            "No file with id or name '" + id_or_name + "'");
    }
    if (matches.size() > 1) {
        std::vector<std::string> names;
        for (const auto* match : matches) {
            names.push_back(match->name + " (" + match->file_id + ")");
        }
        return VaultResult(VaultError::AMBIGUOUS_NAME,
            "'" + id_or_name + "' matches " + StringUtils::join(names, ", "));
    }
    out = *matches.front();
    return VaultResult();
}

}
