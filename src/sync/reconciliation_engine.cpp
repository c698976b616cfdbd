#include "orc/sync/reconciliation_engine.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace orc::sync {

using model::ChangeLogEntry;
using model::CollectionItem;
using model::ConflictKind;
using model::ConflictRecord;
using model::Entity;
using model::MutationKind;

namespace {

/// The last pending edit per target, in device order, plus collection appends
struct LocalEdits {
    std::map<std::string, const ChangeLogEntry*> fields;
    const ChangeLogEntry* status = nullptr;
    std::map<std::string, std::vector<CollectionItem>> appends;
};

LocalEdits index_pending(const std::string& entity_id, const std::vector<ChangeLogEntry>& pending) {
    std::vector<const ChangeLogEntry*> ordered;
    ordered.reserve(pending.size());
    for (const auto& entry : pending) {
        if (entry.entity_id == entity_id) {
            ordered.push_back(&entry);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ChangeLogEntry* a, const ChangeLogEntry* b) {
        if (a->created_at != b->created_at) {
            return a->created_at < b->created_at;
        }
        return a->sequence < b->sequence;
    });

    LocalEdits edits;
    for (const auto* entry : ordered) {
        switch (entry->kind) {
            case MutationKind::FieldUpdate:
                edits.fields[entry->target] = entry;
                break;
            case MutationKind::StatusTransition:
                edits.status = entry;
                break;
            case MutationKind::CollectionAppend:
                edits.appends[entry->target].emplace_back(entry->payload, entry->device_id, entry->created_at);
                break;
        }
    }
    return edits;
}

ConflictRecord make_conflict(const Entity& server, const std::string& field,
                             std::string server_value, std::string local_value, ConflictKind kind) {
    ConflictRecord conflict;
    conflict.conflict_id = ConflictRecord::make_id(server.id, field);
    conflict.entity_id = server.id;
    conflict.entity_type = server.type;
    conflict.field = field;
    conflict.server_value = std::move(server_value);
    conflict.local_value = std::move(local_value);
    conflict.requires_user_choice = true;
    conflict.kind = kind;
    return conflict;
}

} // namespace

ReconciliationResult ReconciliationEngine::reconcile(const Entity& server_snapshot,
                                                     const Entity& local_snapshot,
                                                     const std::vector<ChangeLogEntry>& pending_entries) const {
    ReconciliationResult result;
    const auto edits = index_pending(local_snapshot.id, pending_entries);

    Entity merged = server_snapshot;
    merged.local_updated_at = local_snapshot.local_updated_at;
    for (const auto& [key, raw] : local_snapshot.unknown_attributes) {
        merged.unknown_attributes.emplace(key, raw);
    }

    // a. lifecycle status
    if (edits.status == nullptr) {
        result.status_decision = server_snapshot.status == local_snapshot.status
                                     ? StatusDecision::Unchanged
                                     : StatusDecision::ServerWins;
    } else if (edits.status->resolution_override) {
        merged.status = local_snapshot.status;
        result.status_decision = StatusDecision::LocalWins;
    } else {
        const auto status = rules_.status_reconciler().merge(server_snapshot.status, local_snapshot.status);
        result.status_decision = status.decision;
        merged.status = status.resolved;
        if (status.decision == StatusDecision::Conflict) {
            result.conflicts.push_back(make_conflict(server_snapshot, model::kStatusField,
                                                     model::to_string(server_snapshot.status),
                                                     model::to_string(local_snapshot.status),
                                                     ConflictKind::IrreconcilableStatus));
        }
    }
    result.audit.push_back(FieldResolution{
        model::kStatusField, ResolutionStrategy::Custom,
        result.status_decision == StatusDecision::Conflict
            ? FieldOutcome::Kind::Conflict
            : (merged.status == server_snapshot.status ? FieldOutcome::Kind::UseServer
                                                       : FieldOutcome::Kind::UseLocal),
        edits.status != nullptr});

    // b. scalar fields
    std::set<std::string> names;
    for (const auto& [name, _] : server_snapshot.fields) {
        names.insert(name);
    }
    for (const auto& [name, _] : local_snapshot.fields) {
        names.insert(name);
    }

    const auto& table = FieldResolutionRules::table(server_snapshot.type);
    for (const auto& name : names) {
        const bool server_has = server_snapshot.fields.count(name) > 0;
        const auto server_value = server_snapshot.field_or(name);
        const auto local_value = local_snapshot.field_or(name);

        auto edit_it = edits.fields.find(name);
        const ChangeLogEntry* edit = edit_it != edits.fields.end() ? edit_it->second : nullptr;

        FieldOutcome outcome;
        if (edit != nullptr && edit->resolution_override) {
            outcome = FieldOutcome::use_local(local_value);
        } else {
            Attribution attribution;
            if (edit != nullptr) {
                attribution.device_id = edit->device_id;
                attribution.edited_at = edit->created_at;
            }
            outcome = rules_.resolve(server_snapshot.type, name, server_value, local_value,
                                     edit != nullptr, attribution);
        }

        switch (outcome.kind) {
            case FieldOutcome::Kind::UseServer:
                if (!server_has) {
                    merged.fields.erase(name);
                }
                break;
            case FieldOutcome::Kind::UseLocal:
            case FieldOutcome::Kind::Merged:
                merged.fields[name] = outcome.value;
                break;
            case FieldOutcome::Kind::Conflict:
                result.conflicts.push_back(make_conflict(server_snapshot, name, server_value, local_value,
                                                         ConflictKind::ConcurrentEdit));
                break;
        }
        result.audit.push_back(FieldResolution{name, table.strategy_for(name), outcome.kind, edit != nullptr});
    }

    // c. append-only sub-collections
    std::set<std::string> collections;
    for (const auto& [name, _] : server_snapshot.collections) {
        collections.insert(name);
    }
    for (const auto& [name, _] : local_snapshot.collections) {
        collections.insert(name);
    }
    for (const auto& [name, _] : edits.appends) {
        collections.insert(name);
    }

    static const std::vector<CollectionItem> kEmpty;
    for (const auto& name : collections) {
        auto server_it = server_snapshot.collections.find(name);
        auto local_it = local_snapshot.collections.find(name);
        auto append_it = edits.appends.find(name);

        std::vector<CollectionItem> local_items =
            local_it != local_snapshot.collections.end() ? local_it->second : kEmpty;
        if (append_it != edits.appends.end()) {
            local_items.insert(local_items.end(), append_it->second.begin(), append_it->second.end());
        }

        merged.collections[name] = FieldResolutionRules::union_merge(
            server_it != server_snapshot.collections.end() ? server_it->second : kEmpty, local_items);
    }

    // d. conflicts hold back the entity
    result.needs_resolution = !result.conflicts.empty();
    merged.needs_resolution = result.needs_resolution;
    result.merged = std::move(merged);
    return result;
}

Result<ReconciliationResult> ReconciliationEngine::reconcile(SyncSession& session,
                                                             const Entity& server_snapshot,
                                                             const Entity& local_snapshot,
                                                             const std::vector<ChangeLogEntry>& pending_entries) const {
    auto transition = session.transition_to(SessionState::Reconciling);
    if (transition.is_error()) {
        return Err<ReconciliationResult>(transition.error());
    }
    auto result = reconcile(server_snapshot, local_snapshot, pending_entries);
    session.record_conflicts(result.conflicts.size());
    return Ok(std::move(result));
}

} // namespace orc::sync
