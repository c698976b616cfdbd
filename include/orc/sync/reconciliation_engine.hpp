#pragma once

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"
#include "orc/sync/field_rules.hpp"
#include "orc/sync/session.hpp"
#include "orc/sync/status_reconciler.hpp"

#include <string>
#include <vector>

namespace orc::sync {

/// One line of the audit trail: how a single field was decided
struct FieldResolution {
    std::string field;
    ResolutionStrategy strategy = ResolutionStrategy::ServerWins;
    FieldOutcome::Kind outcome = FieldOutcome::Kind::UseServer;
    bool local_edit = false;
};

struct ReconciliationResult {
    model::Entity merged;
    std::vector<model::ConflictRecord> conflicts;
    bool needs_resolution = false;
    StatusDecision status_decision = StatusDecision::Unchanged;
    std::vector<FieldResolution> audit;
};

/**
 * @brief Merges a server snapshot with the local working copy and pending edits
 *
 * STEPS:
 * a. lifecycle status through the StatusReconciler
 * b. every other field through its resolution rule
 * c. union-merge of every sub-collection, including appends that so far only
 *    exist as pending change log entries
 * d. any conflict marks the result as needing resolution; the visible value of
 *    a conflicted field stays at the server value while the local value is kept
 *    in the conflict record
 *
 * reconcile() is a pure function of its arguments: same inputs, same output.
 */
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(FieldResolutionRules rules = FieldResolutionRules{}) noexcept
        : rules_(std::move(rules)) {}

    [[nodiscard]] ReconciliationResult reconcile(const model::Entity& server_snapshot,
                                                 const model::Entity& local_snapshot,
                                                 const std::vector<model::ChangeLogEntry>& pending_entries) const;

    /// Same merge, driven from a pass: moves the session to Reconciling and records the conflict count
    Result<ReconciliationResult> reconcile(SyncSession& session,
                                   const model::Entity& server_snapshot,
                                   const model::Entity& local_snapshot,
                                   const std::vector<model::ChangeLogEntry>& pending_entries) const;

    [[nodiscard]] const FieldResolutionRules& rules() const noexcept { return rules_; }

private:
    FieldResolutionRules rules_;
};

} // namespace orc::sync
