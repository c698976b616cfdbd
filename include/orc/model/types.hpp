#pragma once

/**
 * @file types.hpp
 * @brief Core record types for offline field-agent reconciliation
 *
 * WHY THIS FILE EXISTS:
 * A field device keeps a local replica of the work orders, customers and
 * price-book items assigned to it. While offline it keeps editing them.
 * Every component of the engine (change log, snapshot store, rules,
 * reconciler, coordinator) speaks in terms of the structs declared here.
 *
 * DESIGN DECISIONS:
 * - Plain structs: data containers, behaviour lives in the sync components
 * - std::map (not unordered_map) for fields and collections so iteration
 *   order, and therefore reconciliation output, is deterministic
 * - Timestamps are milliseconds since the Unix epoch; they are advisory and
 *   only order edits made on the same side
 * - EntityType and LifecycleStatus are closed enums; every switch over them
 *   has no default branch so adding a value breaks the build until every
 *   table handles it
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orc {
namespace model {

using Timestamp = std::int64_t;

/// Field name used for lifecycle status in change log entries and conflicts
inline constexpr const char* kStatusField = "status";

/// Prefix of identifiers generated on the device before the first sync
inline constexpr const char* kTemporaryIdPrefix = "tmp-";

enum class EntityType {
    Job,
    Customer,
    PriceBookItem
};

/**
 * @brief Lifecycle of a work order
 *
 * PROGRESSION (non-terminal, ordered):
 * Pending → Assigned → EnRoute → InProgress
 *
 * TERMINAL:
 * Completed - work finished on site
 * Cancelled - absorbing, may be entered from any non-terminal state
 *
 * Customers and price-book items carry a status too but never leave Pending.
 */
enum class LifecycleStatus {
    Pending,
    Assigned,
    EnRoute,
    InProgress,
    Completed,
    Cancelled
};

/**
 * @brief One element of an append-only sub-collection (photo ref, note, material)
 *
 * Two items are the same item when their content is the same, regardless of
 * who added them or when. content_key() is the identity used by union-merge.
 */
struct CollectionItem {
    std::string content;
    std::string author;
    Timestamp added_at = 0;
    std::map<std::string, std::string> unknown_attributes;  ///< Raw JSON text, see Entity

    CollectionItem() = default;
    CollectionItem(std::string c, std::string a = {}, Timestamp at = 0)
        : content(std::move(c)), author(std::move(a)), added_at(at) {}

    std::string content_key() const;
};

/**
 * @brief A synchronizable business record
 *
 * FIELDS EXPLAINED:
 * - id: server id, or "tmp-..." until the server assigns one
 * - status: lifecycle status (always one of LifecycleStatus)
 * - fields: scalar business fields (address, notes, total, ...)
 * - collections: append-only sub-collections keyed by name ("photos", ...)
 * - server_updated_at: written only from server snapshots
 * - local_updated_at: written only by the device
 * - needs_resolution: set while conflicts on this entity are unresolved
 * - unknown_attributes: attributes this build does not understand, kept as
 *   raw JSON text so they survive a load/save round trip
 */
struct Entity {
    std::string id;
    EntityType type = EntityType::Job;
    LifecycleStatus status = LifecycleStatus::Pending;
    std::map<std::string, std::string> fields;
    std::map<std::string, std::vector<CollectionItem>> collections;
    Timestamp server_updated_at = 0;
    Timestamp local_updated_at = 0;
    bool needs_resolution = false;
    std::map<std::string, std::string> unknown_attributes;

    bool has_temporary_id() const {
        return id.rfind(kTemporaryIdPrefix, 0) == 0;
    }

    std::string field_or(const std::string& name, std::string fallback = {}) const {
        auto it = fields.find(name);
        return it != fields.end() ? it->second : std::move(fallback);
    }
};

enum class MutationKind {
    FieldUpdate,
    StatusTransition,
    CollectionAppend
};

/**
 * @brief Delivery state of a change log entry
 *
 * STATE TRANSITIONS:
 * Pending → InFlight (pass pushes it)
 * InFlight → Acknowledged (server ack)
 * InFlight → Pending (pass cancelled before ack)
 * Pending/InFlight → Conflicted (touches a conflicted field)
 * Pending/InFlight/Conflicted → Failed (retries exhausted or server rejected)
 * Pending/InFlight → Superseded (merge kept the server value or replaced the edit)
 * Conflicted → Superseded (user resolved the conflict)
 *
 * Acknowledged, Failed and Superseded are terminal.
 */
enum class DeliveryState {
    Pending,
    InFlight,
    Acknowledged,
    Conflicted,
    Failed,
    Superseded
};

/**
 * @brief One local mutation awaiting transmission
 *
 * target is the field name for FieldUpdate, kStatusField for
 * StatusTransition and the collection name for CollectionAppend. For status
 * transitions the payload is the status name (see to_string(LifecycleStatus)).
 */
struct ChangeLogEntry {
    std::string entry_id;
    std::string entity_id;
    EntityType entity_type = EntityType::Job;
    MutationKind kind = MutationKind::FieldUpdate;
    std::string target;
    std::string payload;
    std::string device_id;
    Timestamp created_at = 0;
    std::uint64_t sequence = 0;
    bool resolution_override = false;   ///< Records an explicit user choice from conflict resolution
    DeliveryState state = DeliveryState::Pending;
    Timestamp state_changed_at = 0;
    std::map<std::string, std::string> unknown_attributes;  ///< Raw JSON text, see Entity
};

enum class ConflictKind {
    IrreconcilableStatus,   ///< Completed on one side, Cancelled on the other
    ConcurrentEdit          ///< Guarded field edited locally and changed on the server
};

/**
 * @brief A merge outcome that could not be decided automatically
 *
 * conflict_id is derived from entity id and field so re-running a pass over
 * the same inputs yields the same record.
 */
struct ConflictRecord {
    std::string conflict_id;
    std::string entity_id;
    EntityType entity_type = EntityType::Job;
    std::string field;
    std::string server_value;
    std::string local_value;
    bool requires_user_choice = true;
    ConflictKind kind = ConflictKind::ConcurrentEdit;
    Timestamp detected_at = 0;

    static std::string make_id(const std::string& entity_id, const std::string& field) {
        return entity_id + "/" + field;
    }
};

enum class ResolutionChoice {
    KeepLocal,
    KeepServer
};

/// Per-entity status exposed to the host
enum class SyncStatus {
    Synced,
    Pending,
    Conflict,
    Failed
};

// ════════════════════════════════════════════════════════
// Names used in persistence, logs and the wire format
// ════════════════════════════════════════════════════════

std::string to_string(EntityType type);
std::string to_string(LifecycleStatus status);
std::string to_string(MutationKind kind);
std::string to_string(DeliveryState state);
std::string to_string(ConflictKind kind);
std::string to_string(SyncStatus status);

std::optional<EntityType> entity_type_from_string(const std::string& text);
std::optional<LifecycleStatus> status_from_string(const std::string& text);
std::optional<MutationKind> mutation_kind_from_string(const std::string& text);
std::optional<DeliveryState> delivery_state_from_string(const std::string& text);
std::optional<ConflictKind> conflict_kind_from_string(const std::string& text);

/// Every lifecycle status in progression order, terminals last
const std::vector<LifecycleStatus>& all_statuses();

/// Every entity type the engine knows
const std::vector<EntityType>& all_entity_types();

/// FNV-1a of the input rendered as 16 hex digits
std::string content_hash(const std::string& data);

} // namespace model
} // namespace orc
