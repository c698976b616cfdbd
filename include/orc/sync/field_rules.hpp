#pragma once

#include "orc/model/types.hpp"
#include "orc/sync/status_reconciler.hpp"

#include <map>
#include <string>
#include <vector>

namespace orc::sync {

enum class ResolutionStrategy {
    ServerWins,
    LocalWins,
    AppendMerge,    ///< Free text: server text, attribution line, local text
    UnionMerge,     ///< Line sets: union keyed by content hash
    Custom,         ///< Delegated to the StatusReconciler
    RequireChoice   ///< Locally edited and changed on the server: user decides
};

std::string to_string(ResolutionStrategy strategy);

/**
 * @brief Immutable field → strategy table for one entity type
 */
class RuleTable {
public:
    RuleTable(model::EntityType type,
              std::map<std::string, ResolutionStrategy> rules,
              ResolutionStrategy fallback);

    [[nodiscard]] ResolutionStrategy strategy_for(const std::string& field) const;
    [[nodiscard]] model::EntityType type() const noexcept { return type_; }
    [[nodiscard]] const std::map<std::string, ResolutionStrategy>& rules() const noexcept { return rules_; }
    [[nodiscard]] ResolutionStrategy fallback() const noexcept { return fallback_; }

private:
    model::EntityType type_;
    std::map<std::string, ResolutionStrategy> rules_;
    ResolutionStrategy fallback_;
};

/// Who made the local edit being merged; rendered into append-merge separators
struct Attribution {
    std::string device_id;
    model::Timestamp edited_at = 0;
};

struct FieldOutcome {
    enum class Kind {
        UseServer,
        UseLocal,
        Merged,
        Conflict
    };

    Kind kind = Kind::UseServer;
    std::string value;  ///< Value to store; empty for Conflict

    static FieldOutcome use_server(std::string v) { return {Kind::UseServer, std::move(v)}; }
    static FieldOutcome use_local(std::string v) { return {Kind::UseLocal, std::move(v)}; }
    static FieldOutcome merged(std::string v) { return {Kind::Merged, std::move(v)}; }
    static FieldOutcome conflict() { return {Kind::Conflict, {}}; }
};

std::string to_string(FieldOutcome::Kind kind);

/**
 * @brief Per-field resolution for every entity type
 *
 * Holds no mutable state: the rule tables are built once per process and the
 * status reconciler is a value. Safe to share between passes running on
 * different threads.
 */
class FieldResolutionRules {
public:
    explicit FieldResolutionRules(StatusReconciler status_reconciler = StatusReconciler{}) noexcept
        : status_reconciler_(status_reconciler) {}

    /// Rule table for a type; every EntityType has one
    [[nodiscard]] static const RuleTable& table(model::EntityType type);

    [[nodiscard]] FieldOutcome resolve(model::EntityType type,
                                       const std::string& field,
                                       const std::string& server_value,
                                       const std::string& local_value,
                                       bool has_local_pending_edit,
                                       const Attribution& attribution = {}) const;

    /// "--- <device>@<timestamp> ---"
    [[nodiscard]] static std::string attribution_marker(const Attribution& attribution);

    /// server + "\n" + marker + "\n" + local
    [[nodiscard]] static std::string append_merge(const std::string& server_text,
                                                  const std::string& local_text,
                                                  const Attribution& attribution);

    /// Newline-separated sets; server lines first, then unseen local lines
    [[nodiscard]] static std::string union_merge_lines(const std::string& server_text,
                                                       const std::string& local_text);

    /// Sub-collection union keyed by CollectionItem::content_key(); never removes an item
    [[nodiscard]] static std::vector<model::CollectionItem>
    union_merge(const std::vector<model::CollectionItem>& server_items,
                const std::vector<model::CollectionItem>& local_items);

    [[nodiscard]] const StatusReconciler& status_reconciler() const noexcept { return status_reconciler_; }

private:
    [[nodiscard]] FieldOutcome resolve_append(const std::string& server_value,
                                              const std::string& local_value,
                                              bool has_local_pending_edit,
                                              const Attribution& attribution) const;

    [[nodiscard]] FieldOutcome resolve_status(const std::string& server_value,
                                              const std::string& local_value,
                                              bool has_local_pending_edit) const;

    StatusReconciler status_reconciler_;
};

} // namespace orc::sync
