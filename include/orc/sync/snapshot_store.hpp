#pragma once

/**
 * @file snapshot_store.hpp
 * @brief Last-known server version and local working version per entity
 *
 * WHY THIS FILE EXISTS:
 * Reconciliation needs both sides of every entity: what the server said the
 * last time we heard from it, and what the device currently shows. This store
 * keeps the pair, keyed by entity id.
 *
 * THREAD SAFETY PATTERN:
 * - Reads (local, server, list_all) take a shared lock
 * - Writes (put_local, commit, rekey) take an exclusive lock
 * Passes for different entities can read and commit concurrently.
 */

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orc::sync {

struct SnapshotRecord {
    std::optional<model::Entity> server;  ///< Empty until the server has seen the entity
    model::Entity local;
};

class EntitySnapshotStore {
public:
    EntitySnapshotStore() = default;

    /// Store the device's working version (local edit or new local entity)
    Result<void> put_local(const model::Entity& entity);

    /// Record a pass result: the server snapshot it merged against and the merged working version
    Result<void> commit(const std::optional<model::Entity>& server, const model::Entity& merged);

    [[nodiscard]] Result<model::Entity> local(const std::string& entity_id) const;
    [[nodiscard]] Result<model::Entity> server(const std::string& entity_id) const;
    [[nodiscard]] bool contains(const std::string& entity_id) const;

    /// Temporary id → server id after the first successful push
    Result<void> rekey(const std::string& old_id, const std::string& new_id);

    [[nodiscard]] std::vector<std::string> entity_ids() const;
    [[nodiscard]] std::vector<SnapshotRecord> list_all() const;
    [[nodiscard]] std::size_t size() const;

    /// Replace contents with persisted records
    void load(std::vector<SnapshotRecord> records);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SnapshotRecord> records_;
};

} // namespace orc::sync
