#include "orc/sync/change_log.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace orc::sync {

using model::ChangeLogEntry;
using model::DeliveryState;

namespace {

bool same_mutation(const ChangeLogEntry& a, const ChangeLogEntry& b) {
    return a.entity_id == b.entity_id && a.kind == b.kind && a.target == b.target &&
           a.payload == b.payload && a.created_at == b.created_at &&
           a.resolution_override == b.resolution_override;
}

bool is_live(DeliveryState state) {
    return state == DeliveryState::Pending || state == DeliveryState::InFlight ||
           state == DeliveryState::Conflicted;
}

} // namespace

ChangeLog::ChangeLog(std::size_t capacity, std::chrono::milliseconds retention_window)
    : capacity_(capacity), retention_window_(retention_window) {}

Result<std::string> ChangeLog::append(ChangeLogEntry entry) {
    if (entry.entity_id.empty()) {
        return Err<std::string>(ErrorCode::InvalidState, "Change log entry without entity id");
    }

    std::lock_guard lock(mutex_);

    for (const auto& existing : entries_) {
        if (existing.state != DeliveryState::Failed && existing.state != DeliveryState::Superseded &&
            same_mutation(existing, entry)) {
            return Ok(existing.entry_id);
        }
    }

    if (live_count_locked() >= capacity_) {
        return Err<std::string>(ErrorCode::QueueFull,
                                "Change log full (" + std::to_string(capacity_) + " pending entries)");
    }

    entry.sequence = next_sequence_++;
    if (entry.entry_id.empty()) {
        entry.entry_id = (entry.device_id.empty() ? std::string("entry") : entry.device_id) + "-" +
                         std::to_string(entry.sequence);
    }
    entry.state = DeliveryState::Pending;
    entry.state_changed_at = entry.created_at;

    entries_.push_back(entry);
    return Ok(entry.entry_id);
}

std::vector<ChangeLogEntry> ChangeLog::drain(const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ChangeLogEntry> result;
    for (const auto& entry : entries_) {
        if (entry.entity_id == entity_id &&
            (entry.state == DeliveryState::Pending || entry.state == DeliveryState::InFlight)) {
            result.push_back(entry);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const ChangeLogEntry& a, const ChangeLogEntry& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.sequence < b.sequence;
    });
    return result;
}

std::vector<ChangeLogEntry> ChangeLog::entries_for(const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ChangeLogEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [&](const ChangeLogEntry& entry) { return entry.entity_id == entity_id; });
    return result;
}

std::vector<ChangeLogEntry> ChangeLog::entries_in_state(const std::string& entity_id,
                                                        DeliveryState state) const {
    std::lock_guard lock(mutex_);
    std::vector<ChangeLogEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [&](const ChangeLogEntry& entry) {
                     return entry.entity_id == entity_id && entry.state == state;
                 });
    return result;
}

Result<ChangeLogEntry> ChangeLog::find(const std::string& entry_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.entry_id == entry_id) {
            return Ok(entry);
        }
    }
    return Err<ChangeLogEntry>(ErrorCode::NotFound, "Unknown change log entry: " + entry_id);
}

Result<void> ChangeLog::mark_in_flight(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::InFlight, now);
}

Result<void> ChangeLog::mark_delivered(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::Acknowledged, now);
}

Result<void> ChangeLog::mark_conflicted(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::Conflicted, now);
}

Result<void> ChangeLog::mark_failed(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::Failed, now);
}

Result<void> ChangeLog::mark_superseded(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::Superseded, now);
}

Result<void> ChangeLog::release(const std::string& entry_id, model::Timestamp now) {
    return transition(entry_id, DeliveryState::Pending, now);
}

Result<void> ChangeLog::transition(const std::string& entry_id, DeliveryState target, model::Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const ChangeLogEntry& entry) { return entry.entry_id == entry_id; });
    if (it == entries_.end()) {
        return Err<void>(ErrorCode::NotFound, "Unknown change log entry: " + entry_id);
    }

    if (it->state == target) {
        return Ok();
    }

    if (!can_transition(it->state, target)) {
        return Err<void>(ErrorCode::InvalidTransition,
                         "Entry " + entry_id + " cannot move from " + model::to_string(it->state) +
                         " to " + model::to_string(target));
    }

    it->state = target;
    it->state_changed_at = now;
    return Ok();
}

bool ChangeLog::can_transition(DeliveryState from, DeliveryState to) noexcept {
    switch (from) {
        case DeliveryState::Pending:
            return to == DeliveryState::InFlight || to == DeliveryState::Acknowledged ||
                   to == DeliveryState::Conflicted || to == DeliveryState::Failed ||
                   to == DeliveryState::Superseded;
        case DeliveryState::InFlight:
            return to == DeliveryState::Pending || to == DeliveryState::Acknowledged ||
                   to == DeliveryState::Conflicted || to == DeliveryState::Failed ||
                   to == DeliveryState::Superseded;
        case DeliveryState::Conflicted:
            return to == DeliveryState::Superseded || to == DeliveryState::Failed;
        case DeliveryState::Acknowledged:
        case DeliveryState::Failed:
        case DeliveryState::Superseded:
            return false;
    }
    return false;
}

bool ChangeLog::is_terminal(DeliveryState state) noexcept {
    switch (state) {
        case DeliveryState::Pending:
        case DeliveryState::InFlight:
        case DeliveryState::Conflicted:
            return false;
        case DeliveryState::Acknowledged:
        case DeliveryState::Failed:
        case DeliveryState::Superseded:
            return true;
    }
    return false;
}

std::size_t ChangeLog::collect_garbage(model::Timestamp now) {
    std::lock_guard lock(mutex_);
    const auto before = entries_.size();
    const auto retention = static_cast<model::Timestamp>(retention_window_.count());
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const ChangeLogEntry& entry) {
                                      return is_terminal(entry.state) &&
                                             now - entry.state_changed_at >= retention;
                                  }),
                   entries_.end());
    return before - entries_.size();
}

std::size_t ChangeLog::rekey(const std::string& old_entity_id, const std::string& new_entity_id) {
    std::lock_guard lock(mutex_);
    std::size_t moved = 0;
    for (auto& entry : entries_) {
        if (entry.entity_id == old_entity_id) {
            entry.entity_id = new_entity_id;
            ++moved;
        }
    }
    return moved;
}

std::vector<std::string> ChangeLog::entities_with_live_entries() const {
    std::lock_guard lock(mutex_);
    std::set<std::string> ids;
    for (const auto& entry : entries_) {
        if (is_live(entry.state)) {
            ids.insert(entry.entity_id);
        }
    }
    return {ids.begin(), ids.end()};
}

std::size_t ChangeLog::live_count() const {
    std::lock_guard lock(mutex_);
    return live_count_locked();
}

std::size_t ChangeLog::live_count(const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const ChangeLogEntry& entry) { return entry.entity_id == entity_id && is_live(entry.state); }));
}

std::size_t ChangeLog::live_count_locked() const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const ChangeLogEntry& entry) { return is_live(entry.state); }));
}

std::size_t ChangeLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::vector<ChangeLogEntry> ChangeLog::snapshot() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

std::uint64_t ChangeLog::next_sequence() const {
    std::lock_guard lock(mutex_);
    return next_sequence_;
}

Result<void> ChangeLog::restore(std::vector<ChangeLogEntry> entries, std::uint64_t next_sequence) {
    std::lock_guard lock(mutex_);
    std::uint64_t max_sequence = 0;
    for (auto& entry : entries) {
        if (entry.entry_id.empty() || entry.entity_id.empty()) {
            return Err<void>(ErrorCode::StorageError, "Persisted change log entry without id");
        }
        // Never acknowledged before the restart, so it must be sent again
        if (entry.state == DeliveryState::InFlight) {
            entry.state = DeliveryState::Pending;
        }
        max_sequence = std::max(max_sequence, entry.sequence);
    }
    entries_ = std::move(entries);
    next_sequence_ = std::max(max_sequence + 1, next_sequence);
    return Ok();
}

} // namespace orc::sync
