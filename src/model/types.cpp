#include "orc/model/types.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace orc {
namespace model {

std::string content_hash(const std::string& data) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (unsigned char byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= prime;
    }
    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return hex.str();
}

std::string CollectionItem::content_key() const {
    return content_hash(content);
}

std::string to_string(EntityType type) {
    switch (type) {
        case EntityType::Job: return "job";
        case EntityType::Customer: return "customer";
        case EntityType::PriceBookItem: return "price_book_item";
    }
    return "unknown";
}

std::string to_string(LifecycleStatus status) {
    switch (status) {
        case LifecycleStatus::Pending: return "PENDING";
        case LifecycleStatus::Assigned: return "ASSIGNED";
        case LifecycleStatus::EnRoute: return "EN_ROUTE";
        case LifecycleStatus::InProgress: return "IN_PROGRESS";
        case LifecycleStatus::Completed: return "COMPLETED";
        case LifecycleStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string to_string(MutationKind kind) {
    switch (kind) {
        case MutationKind::FieldUpdate: return "field_update";
        case MutationKind::StatusTransition: return "status_transition";
        case MutationKind::CollectionAppend: return "collection_append";
    }
    return "unknown";
}

std::string to_string(DeliveryState state) {
    switch (state) {
        case DeliveryState::Pending: return "pending";
        case DeliveryState::InFlight: return "in_flight";
        case DeliveryState::Acknowledged: return "acknowledged";
        case DeliveryState::Conflicted: return "conflicted";
        case DeliveryState::Failed: return "failed";
        case DeliveryState::Superseded: return "superseded";
    }
    return "unknown";
}

std::string to_string(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::IrreconcilableStatus: return "irreconcilable_status";
        case ConflictKind::ConcurrentEdit: return "concurrent_edit";
    }
    return "unknown";
}

std::string to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Conflict: return "conflict";
        case SyncStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<EntityType> entity_type_from_string(const std::string& text) {
    for (auto type : all_entity_types()) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<LifecycleStatus> status_from_string(const std::string& text) {
    for (auto status : all_statuses()) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<MutationKind> mutation_kind_from_string(const std::string& text) {
    if (text == "field_update") return MutationKind::FieldUpdate;
    if (text == "status_transition") return MutationKind::StatusTransition;
    if (text == "collection_append") return MutationKind::CollectionAppend;
    return std::nullopt;
}

std::optional<DeliveryState> delivery_state_from_string(const std::string& text) {
    if (text == "pending") return DeliveryState::Pending;
    if (text == "in_flight") return DeliveryState::InFlight;
    if (text == "acknowledged") return DeliveryState::Acknowledged;
    if (text == "conflicted") return DeliveryState::Conflicted;
    if (text == "failed") return DeliveryState::Failed;
    if (text == "superseded") return DeliveryState::Superseded;
    return std::nullopt;
}

std::optional<ConflictKind> conflict_kind_from_string(const std::string& text) {
    if (text == "irreconcilable_status") return ConflictKind::IrreconcilableStatus;
    if (text == "concurrent_edit") return ConflictKind::ConcurrentEdit;
    return std::nullopt;
}

const std::vector<LifecycleStatus>& all_statuses() {
    static const std::vector<LifecycleStatus> statuses {
        LifecycleStatus::Pending,
        LifecycleStatus::Assigned,
        LifecycleStatus::EnRoute,
        LifecycleStatus::InProgress,
        LifecycleStatus::Completed,
        LifecycleStatus::Cancelled
    };
    return statuses;
}

const std::vector<EntityType>& all_entity_types() {
    static const std::vector<EntityType> types {
        EntityType::Job,
        EntityType::Customer,
        EntityType::PriceBookItem
    };
    return types;
}

} // namespace model
} // namespace orc
