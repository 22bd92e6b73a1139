#pragma once

#include "televault/core/result.hpp"
#include "televault/remote/remote_channel.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>

namespace televault::storage {

// The vault's single source of truth, stored in one pinned record. Maps file
// ids to the handle of their metadata blob.
struct CatalogIndex {
    static constexpr int SCHEMA_VERSION = 1;

    uint64_t version = 0;
    std::map<std::string, remote::RemoteRef> files;

    // Ids that were deleted. Never handed out again.
    std::set<std::string> tombstones;

    std::chrono::system_clock::time_point updated_at{};
    int schema = SCHEMA_VERSION;
    nlohmann::json extra = nlohmann::json::object();

    bool contains(const std::string& file_id) const { return files.count(file_id) != 0; }
    bool is_tombstoned(const std::string& file_id) const { return tombstones.count(file_id) != 0; }
    bool is_taken(const std::string& file_id) const { return contains(file_id) || is_tombstoned(file_id); }
    std::optional<remote::RemoteRef> find(const std::string& file_id) const;

    nlohmann::json to_json() const;
    std::string serialize() const;

    static core::VaultResult from_json(const nlohmann::json& j, CatalogIndex& out);

    // Empty input is an empty catalog at version 0.
    static core::VaultResult parse(std::span<const uint8_t> bytes, CatalogIndex& out);
};

} // namespace televault::storage
