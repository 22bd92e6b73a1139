#include "televault/core/result.hpp"
#include <sstream>

namespace televault::core {

const char* to_string(VaultError error) {
    switch (error) {
        case VaultError::SUCCESS: return "Success";
        case VaultError::INVALID_ARGUMENT: return "InvalidArgument";
        case VaultError::CONFIG_INVALID: return "ConfigInvalid";
        case VaultError::CHUNK_SIZE_EXCEEDS_LIMIT: return "ChunkSizeExceedsLimit";
        case VaultError::MISSING_CREDENTIALS: return "MissingCredentials";
        case VaultError::IO_ERROR: return "IoError";
        case VaultError::TRANSIENT: return "Transient";
        case VaultError::TIMEOUT: return "Timeout";
        case VaultError::RATE_LIMITED: return "RateLimited";
        case VaultError::NOT_FOUND: return "NotFound";
        case VaultError::CONFLICT: return "Conflict";
        case VaultError::UNSUPPORTED: return "Unsupported";
        case VaultError::CATALOG_CONTENTION: return "CatalogContention";
        case VaultError::CATALOG_CORRUPT: return "CatalogCorrupt";
        case VaultError::NOT_FOUND_IN_CATALOG: return "NotFoundInCatalog";
        case VaultError::AMBIGUOUS_NAME: return "AmbiguousName";
        case VaultError::DUPLICATE_FILE_ID: return "DuplicateFileId";
        case VaultError::KEY_DERIVATION_FAILED: return "KeyDerivationFailed";
        case VaultError::ENCRYPTION_FAILED: return "EncryptionFailed";
        case VaultError::DECRYPTION_FAILED: return "DecryptionFailed";
        case VaultError::TAMPERED_OR_CORRUPT: return "TamperedOrCorrupt";
        case VaultError::COMPRESSION_FAILED: return "CompressionFailed";
        case VaultError::INCOMPLETE_SEQUENCE: return "IncompleteSequence";
        case VaultError::SIZE_MISMATCH: return "SizeMismatch";
        case VaultError::CHUNK_MISSING: return "ChunkMissing";
        case VaultError::UPLOAD_FAILED: return "UploadFailed";
        case VaultError::CANCELLED: return "Cancelled";
        case VaultError::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

bool is_transient(VaultError error) {
    return error == VaultError::TRANSIENT ||
           error == VaultError::TIMEOUT ||
           error == VaultError::RATE_LIMITED;
}

VaultResult& VaultResult::in_operation(const std::string& op) {
    if (operation.empty()) {
        operation = op;
    }
    return *this;
}

VaultResult& VaultResult::for_file(const std::string& id) {
    if (file_id.empty()) {
        file_id = id;
    }
    return *this;
}

VaultResult& VaultResult::at_chunk(uint64_t index) {
    chunk_index = index;
    return *this;
}

VaultResult& VaultResult::caused_by(VaultError kind) {
    cause = kind;
    return *this;
}

std::string VaultResult::describe() const {
    if (success()) {
        return "ok";
    }

    std::ostringstream oss;
    if (!operation.empty()) {
        oss << operation << " failed";
    } else {
        oss << "failed";
    }
    if (!file_id.empty()) {
        oss << " [file " << file_id << "]";
    }
    oss << ": " << to_string(error);
    if (chunk_index) {
        oss << " at chunk " << *chunk_index;
    }
    if (cause != VaultError::SUCCESS) {
        oss << " (cause: " << to_string(cause) << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

}
