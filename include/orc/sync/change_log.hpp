#pragma once

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace orc::sync {

/**
 * @brief Append-only queue of local mutations awaiting server acknowledgment
 *
 * The only component that knows the order of edits on this device. Entries
 * are never edited after append; only their delivery state moves forward.
 *
 * CAPACITY:
 * Bounded by the number of live (non-terminal) entries across all entities.
 * A full log rejects new appends with QueueFull; nothing is dropped.
 *
 * THREAD SAFETY:
 * Every operation takes the internal mutex, so UI-thread appends can race a
 * background pass that drains and marks entries.
 */
class ChangeLog {
public:
    static constexpr std::size_t kDefaultCapacity = 50;

    explicit ChangeLog(std::size_t capacity = kDefaultCapacity,
                       std::chrono::milliseconds retention_window = std::chrono::hours(24));

    /**
     * @brief Append a mutation
     *
     * Assigns entry_id (when empty) and sequence. An entry matching an
     * existing non-failed entry on (entity, kind, target, payload, created_at)
     * is not appended again; the existing id is returned.
     */
    Result<std::string> append(model::ChangeLogEntry entry);

    /// Deliverable (Pending and InFlight) entries of one entity in append order
    [[nodiscard]] std::vector<model::ChangeLogEntry> drain(const std::string& entity_id) const;

    [[nodiscard]] std::vector<model::ChangeLogEntry> entries_for(const std::string& entity_id) const;
    [[nodiscard]] std::vector<model::ChangeLogEntry> entries_in_state(const std::string& entity_id,
                                                                     model::DeliveryState state) const;
    [[nodiscard]] Result<model::ChangeLogEntry> find(const std::string& entry_id) const;

    Result<void> mark_in_flight(const std::string& entry_id, model::Timestamp now);
    Result<void> mark_delivered(const std::string& entry_id, model::Timestamp now);
    Result<void> mark_conflicted(const std::string& entry_id, model::Timestamp now);
    Result<void> mark_failed(const std::string& entry_id, model::Timestamp now);
    Result<void> mark_superseded(const std::string& entry_id, model::Timestamp now);

    /// InFlight → Pending, for passes cancelled before the server acknowledged
    Result<void> release(const std::string& entry_id, model::Timestamp now);

    /// Drop terminal entries older than the retention window; returns how many were removed
    std::size_t collect_garbage(model::Timestamp now);

    /// Move every entry of a temporary entity id to its server id
    std::size_t rekey(const std::string& old_entity_id, const std::string& new_entity_id);

    /// Entities with at least one live entry
    [[nodiscard]] std::vector<std::string> entities_with_live_entries() const;

    [[nodiscard]] std::size_t live_count() const;
    [[nodiscard]] std::size_t live_count(const std::string& entity_id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Full copy for persistence
    [[nodiscard]] std::vector<model::ChangeLogEntry> snapshot() const;

    /// Sequence the next appended entry will get; persisted so ids are never reused after GC
    [[nodiscard]] std::uint64_t next_sequence() const;

    /**
     * @brief Replace contents with persisted entries (InFlight entries come back as Pending)
     *
     * next_sequence is the counter saved with the entries. Collected entries
     * are gone from the file, so the counter is the only record of the ids
     * they used.
     */
    Result<void> restore(std::vector<model::ChangeLogEntry> entries, std::uint64_t next_sequence = 1);

    [[nodiscard]] static bool is_terminal(model::DeliveryState state) noexcept;

private:
    Result<void> transition(const std::string& entry_id, model::DeliveryState target, model::Timestamp now);
    [[nodiscard]] static bool can_transition(model::DeliveryState from, model::DeliveryState to) noexcept;
    [[nodiscard]] std::size_t live_count_locked() const;

    std::size_t capacity_;
    std::chrono::milliseconds retention_window_;

    mutable std::mutex mutex_;
    std::vector<model::ChangeLogEntry> entries_;
    std::uint64_t next_sequence_ = 1;
};

} // namespace orc::sync
