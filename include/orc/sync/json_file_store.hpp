#pragma once

/**
 * @file json_file_store.hpp
 * @brief Durable on-device state as JSON documents in one directory
 *
 * LAYOUT:
 * <root>/change_log.json   {"version": 1, "next_sequence": N, "entries": [...]}
 * <root>/snapshots.json    {"version": 1, "entities": {"<id>": {"server": {...}|null, "local": {...}}}}
 * <root>/conflicts.json    {"version": 1, "conflicts": [...]}
 *
 * Every write goes to "<file>.tmp" first and is renamed over the target, so a
 * crash mid-write leaves the previous document intact. A missing document
 * loads as empty state (first start on a device).
 */

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"
#include "orc/sync/change_log.hpp"
#include "orc/sync/coordinator.hpp"
#include "orc/sync/snapshot_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace orc::sync {

class JsonFileStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit JsonFileStore(std::filesystem::path root);

    Result<void> save_change_log(const ChangeLog& change_log) const;
    Result<void> load_change_log(ChangeLog& change_log) const;

    Result<void> save_snapshots(const EntitySnapshotStore& store) const;
    Result<void> load_snapshots(EntitySnapshotStore& store) const;

    Result<void> save_conflicts(const std::vector<model::ConflictRecord>& conflicts) const;
    Result<std::vector<model::ConflictRecord>> load_conflicts() const;

    /// Everything a device needs to resume after a restart
    Result<void> save_all(const ChangeLog& change_log,
                          const EntitySnapshotStore& store,
                          const SyncCoordinator& coordinator) const;
    Result<void> load_all(ChangeLog& change_log, EntitySnapshotStore& store, SyncCoordinator& coordinator) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<void> write_document(const std::string& name, const nlohmann::json& document) const;
    Result<std::optional<nlohmann::json>> read_document(const std::string& name) const;

    std::filesystem::path root_;
};

} // namespace orc::sync
