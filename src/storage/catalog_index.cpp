#include "televault/storage/catalog_index.hpp"
#include "televault/core/utils.hpp"

namespace televault::storage {

using nlohmann::json;
using core::utils::TimeUtils;

std::optional<remote::RemoteRef> CatalogIndex::find(const std::string& file_id) const {
    auto it = files.find(file_id);
    if (it == files.end()) {
        return std::nullopt;
    }
    return it->second;
}

json CatalogIndex::to_json() const {
    json j = extra.is_object() ? extra : json::object();
    j["schema"] = schema;
    j["version"] = version;
    j["files"] = files;
    j["tombstones"] = tombstones;
    j["updated_at"] = TimeUtils::to_unix_seconds(updated_at);
    return j;
}

std::string CatalogIndex::serialize() const {
    return to_json().dump();
}

core::VaultResult CatalogIndex::from_json(const json& j, CatalogIndex& out) {
    if (!j.is_object()) {
        return core::VaultResult(core::VaultError::CATALOG_CORRUPT, "Catalog is not a JSON object");
    }
    try {
        CatalogIndex index;
        index.schema = j.value("schema", 1);
        index.version = j.at("version").get<uint64_t>();
        index.files = j.value("files", std::map<std::string, remote::RemoteRef>{});
        index.tombstones = j.value("tombstones", std::set<std::string>{});
        index.updated_at = TimeUtils::from_unix_seconds(j.value("updated_at", 0.0));

        index.extra = json::object();
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& key = it.key();
            if (key != "schema" && key != "version" && key != "files" &&
                key != "tombstones" && key != "updated_at") {
                index.extra[key] = it.value();
            }
        }
        out = std::move(index);
    } catch (const json::exception& e) {
        return core::VaultResult(core::VaultError::CATALOG_CORRUPT,
            std::string("Malformed catalog: ") + e.what());
    }
    return core::VaultResult();
}

core::VaultResult CatalogIndex::parse(std::span<const uint8_t> bytes, CatalogIndex& out) {
    if (bytes.empty()) {
        out = CatalogIndex{};
        return core::VaultResult();
    }
    auto j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded()) {
        return core::VaultResult(core::VaultError::CATALOG_CORRUPT, "Catalog is not valid JSON");
    }
    return from_json(j, out);
}

} // namespace televault::storage
