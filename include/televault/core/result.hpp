#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace televault::core {

enum class VaultError {
    SUCCESS = 0,

    // Configuration / usage
    INVALID_ARGUMENT,
    CONFIG_INVALID,
    CHUNK_SIZE_EXCEEDS_LIMIT,
    MISSING_CREDENTIALS,
    IO_ERROR,

    // Transient, retried with backoff
    TRANSIENT,
    TIMEOUT,
    RATE_LIMITED,

    // Remote channel
    NOT_FOUND,
    CONFLICT,
    UNSUPPORTED,

    // Catalog
    CATALOG_CONTENTION,
    CATALOG_CORRUPT,
    NOT_FOUND_IN_CATALOG,
    AMBIGUOUS_NAME,
    DUPLICATE_FILE_ID,

    // Crypto pipeline
    KEY_DERIVATION_FAILED,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    TAMPERED_OR_CORRUPT,
    COMPRESSION_FAILED,

    // Chunking / reassembly
    INCOMPLETE_SEQUENCE,
    SIZE_MISMATCH,

    // Transfer
    CHUNK_MISSING,
    UPLOAD_FAILED,
    CANCELLED,
    INVALID_STATE
};

const char* to_string(VaultError error);

bool is_transient(VaultError error);

struct VaultResult {
    VaultError error;
    std::string message;

    // Context filled in as the result propagates outwards.
    std::string operation;
    std::string file_id;
    std::optional<uint64_t> chunk_index;
    VaultError cause = VaultError::SUCCESS;

    VaultResult(VaultError err = VaultError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == VaultError::SUCCESS; }
    operator bool() const { return success(); }

    bool transient() const { return is_transient(error); }

    VaultResult& in_operation(const std::string& op);
    VaultResult& for_file(const std::string& id);
    VaultResult& at_chunk(uint64_t index);
    VaultResult& caused_by(VaultError kind);

    // "push failed [file a1b2c3]: UploadFailed at chunk 2 (cause: Timeout): ..."
    std::string describe() const;
};

}
