#include "orc/sync/json_file_store.hpp"

#include "orc/model/json_codec.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace orc::sync {
namespace fs = std::filesystem;

namespace {

constexpr const char* kChangeLogFile = "change_log.json";
constexpr const char* kSnapshotsFile = "snapshots.json";
constexpr const char* kConflictsFile = "conflicts.json";

Result<void> check_version(const json& document, const std::string& name) {
    const int version = document.value("version", 0);
    if (version != JsonFileStore::kFormatVersion) {
        return Err<void>(ErrorCode::StorageError,
                         name + " has unsupported format version " + std::to_string(version));
    }
    return Ok();
}

} // namespace

JsonFileStore::JsonFileStore(fs::path root) : root_(std::move(root)) {}

Result<void> JsonFileStore::write_document(const std::string& name, const json& document) const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Err<void>(ErrorCode::StorageError, "Cannot create " + root_.string() + ": " + ec.message());
    }

    const fs::path target = root_ / name;
    const fs::path staging = root_ / (name + ".tmp");
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::StorageError, "Cannot open " + staging.string() + " for writing");
        }
        output << document.dump(2);
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::StorageError, "Short write to " + staging.string());
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        return Err<void>(ErrorCode::StorageError, "Cannot replace " + target.string() + ": " + ec.message());
    }
    spdlog::debug("Wrote {}", target.string());
    return Ok();
}

Result<std::optional<json>> JsonFileStore::read_document(const std::string& name) const {
    const fs::path path = root_ / name;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Err<std::optional<json>>(ErrorCode::StorageError, "Cannot stat " + path.string() + ": " + ec.message());
        }
        return Ok(std::optional<json>{});
    }

    std::ifstream input(path);
    if (!input) {
        return Err<std::optional<json>>(ErrorCode::StorageError, "Cannot open " + path.string());
    }
    json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<std::optional<json>>(ErrorCode::StorageError, path.string() + " is not a JSON object");
    }
    spdlog::debug("Read {}", path.string());
    return Ok(std::optional<json>(std::move(document)));
}

// ════════════════════════════════════════════════════════
// Change log
// ════════════════════════════════════════════════════════

Result<void> JsonFileStore::save_change_log(const ChangeLog& change_log) const {
    json entries = json::array();
    for (const auto& entry : change_log.snapshot()) {
        entries.push_back(model::entry_to_json(entry));
    }
    return write_document(kChangeLogFile, json{{"version", kFormatVersion},
                                               {"next_sequence", change_log.next_sequence()},
                                               {"entries", std::move(entries)}});
}

Result<void> JsonFileStore::load_change_log(ChangeLog& change_log) const {
    auto document = read_document(kChangeLogFile);
    if (document.is_error()) {
        return Err<void>(document.error());
    }
    if (!document.value()) {
        return Ok();
    }
    const auto& doc = *document.value();
    if (auto version = check_version(doc, kChangeLogFile); version.is_error()) {
        return version;
    }

    std::vector<model::ChangeLogEntry> entries;
    const auto it = doc.find("entries");
    if (it != doc.end()) {
        if (!it->is_array()) {
            return Err<void>(ErrorCode::StorageError, std::string(kChangeLogFile) + ": entries must be an array");
        }
        for (const auto& item : *it) {
            auto entry = model::entry_from_json(item);
            if (entry.is_error()) {
                return Err<void>(entry.error());
            }
            entries.push_back(std::move(entry.value()));
        }
    }
    std::uint64_t next_sequence = 1;
    try {
        next_sequence = doc.value("next_sequence", std::uint64_t{1});
    } catch (const json::exception& e) {
        return Err<void>(ErrorCode::StorageError, std::string(kChangeLogFile) + ": bad next_sequence: " + e.what());
    }
    return change_log.restore(std::move(entries), next_sequence);
}

// ════════════════════════════════════════════════════════
// Snapshots
// ════════════════════════════════════════════════════════

Result<void> JsonFileStore::save_snapshots(const EntitySnapshotStore& store) const {
    json entities = json::object();
    for (const auto& record : store.list_all()) {
        entities[record.local.id] = json{
            {"server", record.server ? model::entity_to_json(*record.server) : json(nullptr)},
            {"local", model::entity_to_json(record.local)}
        };
    }
    return write_document(kSnapshotsFile, json{{"version", kFormatVersion}, {"entities", std::move(entities)}});
}

Result<void> JsonFileStore::load_snapshots(EntitySnapshotStore& store) const {
    auto document = read_document(kSnapshotsFile);
    if (document.is_error()) {
        return Err<void>(document.error());
    }
    if (!document.value()) {
        return Ok();
    }
    const auto& doc = *document.value();
    if (auto version = check_version(doc, kSnapshotsFile); version.is_error()) {
        return version;
    }

    std::vector<SnapshotRecord> records;
    const auto it = doc.find("entities");
    if (it != doc.end()) {
        if (!it->is_object()) {
            return Err<void>(ErrorCode::StorageError, std::string(kSnapshotsFile) + ": entities must be an object");
        }
        for (const auto& [id, pair] : it->items()) {
            if (!pair.is_object() || !pair.contains("local")) {
                return Err<void>(ErrorCode::StorageError, "Snapshot " + id + " has no local version");
            }
            SnapshotRecord record;
            auto local = model::entity_from_json(pair.at("local"));
            if (local.is_error()) {
                return Err<void>(local.error());
            }
            record.local = std::move(local.value());

            const auto server_it = pair.find("server");
            if (server_it != pair.end() && !server_it->is_null()) {
                auto server = model::entity_from_json(*server_it);
                if (server.is_error()) {
                    return Err<void>(server.error());
                }
                record.server = std::move(server.value());
            }
            records.push_back(std::move(record));
        }
    }
    store.load(std::move(records));
    return Ok();
}

// ════════════════════════════════════════════════════════
// Conflicts
// ════════════════════════════════════════════════════════

Result<void> JsonFileStore::save_conflicts(const std::vector<model::ConflictRecord>& conflicts) const {
    json list = json::array();
    for (const auto& conflict : conflicts) {
        list.push_back(model::conflict_to_json(conflict));
    }
    return write_document(kConflictsFile, json{{"version", kFormatVersion}, {"conflicts", std::move(list)}});
}

Result<std::vector<model::ConflictRecord>> JsonFileStore::load_conflicts() const {
    using Conflicts = std::vector<model::ConflictRecord>;

    auto document = read_document(kConflictsFile);
    if (document.is_error()) {
        return Err<Conflicts>(document.error());
    }
    Conflicts conflicts;
    if (!document.value()) {
        return Ok(std::move(conflicts));
    }
    const auto& doc = *document.value();
    if (auto version = check_version(doc, kConflictsFile); version.is_error()) {
        return Err<Conflicts>(version.error());
    }

    const auto it = doc.find("conflicts");
    if (it != doc.end() && it->is_array()) {
        for (const auto& item : *it) {
            auto conflict = model::conflict_from_json(item);
            if (conflict.is_error()) {
                return Err<Conflicts>(conflict.error());
            }
            conflicts.push_back(std::move(conflict.value()));
        }
    }
    return Ok(std::move(conflicts));
}

// ════════════════════════════════════════════════════════
// Whole device state
// ════════════════════════════════════════════════════════

Result<void> JsonFileStore::save_all(const ChangeLog& change_log,
                                     const EntitySnapshotStore& store,
                                     const SyncCoordinator& coordinator) const {
    if (auto saved = save_change_log(change_log); saved.is_error()) {
        return saved;
    }
    if (auto saved = save_snapshots(store); saved.is_error()) {
        return saved;
    }
    return save_conflicts(coordinator.pending_conflicts());
}

Result<void> JsonFileStore::load_all(ChangeLog& change_log,
                                     EntitySnapshotStore& store,
                                     SyncCoordinator& coordinator) const {
    if (auto loaded = load_change_log(change_log); loaded.is_error()) {
        return loaded;
    }
    if (auto loaded = load_snapshots(store); loaded.is_error()) {
        return loaded;
    }
    auto conflicts = load_conflicts();
    if (conflicts.is_error()) {
        return Err<void>(conflicts.error());
    }
    coordinator.restore_conflicts(conflicts.value());
    spdlog::info("Restored {} entities, {} change log entries, {} conflicts from {}", store.size(),
                 change_log.size(), conflicts.value().size(), root_.string());
    return Ok();
}

} // namespace orc::sync
