#include "televault/remote/directory_channel.hpp"
#include "televault/core/logger.hpp"
#include "televault/core/utils.hpp"
#include "televault/crypto/random.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace televault::remote {

using core::utils::FileUtils;

namespace {

// Holds an exclusive flock for its lifetime.
class ScopedFileLock {
public:
    explicit ScopedFileLock(const std::filesystem::path& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT, 0600);
        if (fd_ >= 0 && flock(fd_, LOCK_EX) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

    bool locked() const { return fd_ >= 0; }
    int fd() const { return fd_; }

private:
    int fd_ = -1;
};

core::VaultResult io_error(const std::string& what, const std::filesystem::path& path) {
    return core::VaultResult(core::VaultError::IO_ERROR,
        what + " " + path.string() + ": " + std::strerror(errno));
}

void encode_version(uint64_t version, uint8_t* out) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(version >> (8 * i));
    }
}

uint64_t decode_version(const uint8_t* in) {
    uint64_t version = 0;
    for (int i = 0; i < 8; ++i) {
        version |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return version;
}

}

DirectoryChannel::DirectoryChannel(const std::filesystem::path& root, uint64_t max_blob_size)
    : root_(root), max_blob_size_(max_blob_size) {
}

core::VaultResult DirectoryChannel::open() {
    for (const char* sub : {"blobs", "replies", "pinned"}) {
        if (!FileUtils::create_directories(root_ / sub)) {
            return core::VaultResult(core::VaultError::IO_ERROR,
                "Cannot create " + (root_ / sub).string());
        }
    }
    LOG_DEBUG("Directory channel ready at {}", root_.string());
    return core::VaultResult();
}

void DirectoryChannel::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ms_ = timeout.count();
}

std::chrono::milliseconds DirectoryChannel::timeout() const {
    return std::chrono::milliseconds(timeout_ms_.load());
}

bool DirectoryChannel::valid_name(const std::string& name) {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return name != "." && name != "..";
}

std::filesystem::path DirectoryChannel::blob_path(const RemoteRef& ref) const {
    return root_ / "blobs" / ref;
}

std::filesystem::path DirectoryChannel::replies_path(const RemoteRef& parent) const {
    return root_ / "replies" / parent;
}

std::filesystem::path DirectoryChannel::pin_path(const std::string& slot) const {
    return root_ / "pinned" / (slot + ".pin");
}

std::filesystem::path DirectoryChannel::lock_path(const std::string& slot) const {
    return root_ / "pinned" / (slot + ".lock");
}

core::VaultResult DirectoryChannel::put_blob(std::span<const uint8_t> data,
                                             const std::optional<RemoteRef>& reply_to,
                                             RemoteRef& out_ref) {
    if (data.size() > max_blob_size_) {
        return core::VaultResult(core::VaultError::CHUNK_SIZE_EXCEEDS_LIMIT,
            "Blob of " + std::to_string(data.size()) + " bytes exceeds channel limit");
    }
    if (reply_to && (!valid_name(*reply_to) || !FileUtils::is_file(blob_path(*reply_to)))) {
        return core::VaultResult(core::VaultError::NOT_FOUND, "Reply target " + *reply_to + " does not exist");
    }

    RemoteRef ref = crypto::SecureRandom::generate_hex_id(16);
    auto path = blob_path(ref);
    if (!FileUtils::write_binary_atomic(path, data)) {
        return io_error("Cannot write blob", path);
    }

    if (reply_to) {
        auto list_path = replies_path(*reply_to);
        ScopedFileLock lock(list_path);
        if (!lock.locked()) {
            return io_error("Cannot lock reply list", list_path);
        }
        std::string line = ref + "\n";
        if (::lseek(lock.fd(), 0, SEEK_END) < 0 ||
            ::write(lock.fd(), line.data(), line.size()) != static_cast<ssize_t>(line.size())) {
            return io_error("Cannot append to reply list", list_path);
        }
    }

    out_ref = std::move(ref);
    return core::VaultResult();
}

core::VaultResult DirectoryChannel::get_blob(const RemoteRef& ref, std::vector<uint8_t>& out_data) {
    if (!valid_name(ref)) {
        return core::VaultResult(core::VaultError::NOT_FOUND, "Invalid blob reference");
    }
    auto path = blob_path(ref);
    if (!FileUtils::is_file(path)) {
        return core::VaultResult(core::VaultError::NOT_FOUND, "No blob " + ref);
    }
    auto data = FileUtils::read_binary(path);
    if (!data) {
        return io_error("Cannot read blob", path);
    }
    out_data = std::move(*data);
    return core::VaultResult();
}

core::VaultResult DirectoryChannel::read_pinned(const std::string& slot, PinnedRecord& out_record) const {
    out_record = PinnedRecord{};
    auto path = pin_path(slot);
    if (!FileUtils::is_file(path)) {
        return core::VaultResult();
    }
    auto data = FileUtils::read_binary(path);
    if (!data) {
        return io_error("Cannot read pinned record", path);
    }
    if (data->size() < 8) {
        return core::VaultResult(core::VaultError::IO_ERROR, "Truncated pinned record " + path.string());
    }
    out_record.version = decode_version(data->data());
    out_record.data.assign(data->begin() + 8, data->end());
    out_record.exists = true;
    return core::VaultResult();
}

core::VaultResult DirectoryChannel::pin_and_get(const std::string& slot, PinnedRecord& out_record) {
    if (!valid_name(slot)) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT, "Invalid slot name '" + slot + "'");
    }
    // The pin file is only ever replaced by rename, so a lock-free read sees
    // either the old or the new record.
    return read_pinned(slot, out_record);
}

core::VaultResult DirectoryChannel::update_pinned(const std::string& slot,
                                                  std::span<const uint8_t> data,
                                                  uint64_t expected_version,
                                                  uint64_t& out_new_version) {
    if (!valid_name(slot)) {
        return core::VaultResult(core::VaultError::INVALID_ARGUMENT, "Invalid slot name '" + slot + "'");
    }

    ScopedFileLock lock(lock_path(slot));
    if (!lock.locked()) {
        return io_error("Cannot lock slot", lock_path(slot));
    }

    PinnedRecord current;
    auto status = read_pinned(slot, current);
    if (!status) {
        return status;
    }
    if (current.version != expected_version) {
        return core::VaultResult(core::VaultError::CONFLICT,
            "Slot '" + slot + "' is at version " + std::to_string(current.version) +
            ", expected " + std::to_string(expected_version));
    }

    std::vector<uint8_t> record(8 + data.size());
    encode_version(current.version + 1, record.data());
    std::copy(data.begin(), data.end(), record.begin() + 8);

    auto path = pin_path(slot);
    if (!FileUtils::write_binary_atomic(path, record)) {
        return io_error("Cannot write pinned record", path);
    }
    out_new_version = current.version + 1;
    return core::VaultResult();
}

core::VaultResult DirectoryChannel::list_replies(const RemoteRef& parent, std::vector<RemoteRef>& out_refs) {
    out_refs.clear();
    if (!valid_name(parent)) {
        return core::VaultResult();
    }
    auto list_path = replies_path(parent);
    if (!FileUtils::is_file(list_path)) {
        return core::VaultResult();
    }

    std::ifstream file(list_path);
    if (!file.is_open()) {
        return io_error("Cannot read reply list", list_path);
    }
    std::string line;
    while (std::getline(file, line)) {
        if (valid_name(line) && FileUtils::is_file(blob_path(line))) {
            out_refs.push_back(line);
        }
    }
    return core::VaultResult();
}

core::VaultResult DirectoryChannel::delete_blobs(const std::vector<RemoteRef>& refs) {
    size_t failures = 0;
    for (const auto& ref : refs) {
        if (!valid_name(ref)) {
            continue;
        }
        std::error_code ec;
        std::filesystem::remove(blob_path(ref), ec);
        if (ec) {
            ++failures;
            LOG_WARN("Could not delete blob {}: {}", ref, ec.message());
        }
        std::filesystem::remove(replies_path(ref), ec);
    }
    if (failures > 0) {
        return core::VaultResult(core::VaultError::IO_ERROR,
            std::to_string(failures) + " blob(s) could not be deleted");
    }
    return core::VaultResult();
}

} // namespace televault::remote
