#include "orc/sync/snapshot_store.hpp"

#include <algorithm>
#include <mutex>

namespace orc::sync {

Result<void> EntitySnapshotStore::put_local(const model::Entity& entity) {
    if (entity.id.empty()) {
        return Err<void>(ErrorCode::InvalidState, "Entity without id");
    }
    std::unique_lock lock(mutex_);
    records_[entity.id].local = entity;
    return Ok();
}

Result<void> EntitySnapshotStore::commit(const std::optional<model::Entity>& server,
                                         const model::Entity& merged) {
    if (merged.id.empty()) {
        return Err<void>(ErrorCode::InvalidState, "Merged entity without id");
    }
    if (server && server->id != merged.id) {
        return Err<void>(ErrorCode::InvalidState,
                         "Server snapshot " + server->id + " does not match merged entity " + merged.id);
    }

    std::unique_lock lock(mutex_);
    auto& record = records_[merged.id];
    if (server) {
        record.server = server;
    }
    record.local = merged;
    return Ok();
}

Result<model::Entity> EntitySnapshotStore::local(const std::string& entity_id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(entity_id);
    if (it == records_.end()) {
        return Err<model::Entity>(ErrorCode::NotFound, "No local snapshot for " + entity_id);
    }
    return Ok(it->second.local);
}

Result<model::Entity> EntitySnapshotStore::server(const std::string& entity_id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(entity_id);
    if (it == records_.end() || !it->second.server) {
        return Err<model::Entity>(ErrorCode::NotFound, "No server snapshot for " + entity_id);
    }
    return Ok(*it->second.server);
}

bool EntitySnapshotStore::contains(const std::string& entity_id) const {
    std::shared_lock lock(mutex_);
    return records_.find(entity_id) != records_.end();
}

Result<void> EntitySnapshotStore::rekey(const std::string& old_id, const std::string& new_id) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(old_id);
    if (it == records_.end()) {
        return Err<void>(ErrorCode::NotFound, "No snapshot for " + old_id);
    }
    if (records_.find(new_id) != records_.end()) {
        return Err<void>(ErrorCode::InvalidState, "Snapshot already exists for " + new_id);
    }

    SnapshotRecord record = std::move(it->second);
    records_.erase(it);
    record.local.id = new_id;
    if (record.server) {
        record.server->id = new_id;
    }
    records_.emplace(new_id, std::move(record));
    return Ok();
}

std::vector<std::string> EntitySnapshotStore::entity_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, _] : records_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<SnapshotRecord> EntitySnapshotStore::list_all() const {
    std::shared_lock lock(mutex_);
    std::vector<SnapshotRecord> result;
    result.reserve(records_.size());
    for (const auto& [_, record] : records_) {
        result.push_back(record);
    }
    return result;
}

std::size_t EntitySnapshotStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

void EntitySnapshotStore::load(std::vector<SnapshotRecord> records) {
    std::unique_lock lock(mutex_);
    records_.clear();
    for (auto& record : records) {
        const auto id = record.local.id;
        records_[id] = std::move(record);
    }
}

} // namespace orc::sync
