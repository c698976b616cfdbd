#pragma once

#include "orc/model/types.hpp"

#include <string>

namespace orc::sync {

/**
 * @brief What to do when the server moved a job backwards before work started
 *
 * Both sides below InProgress and the server is behind the device:
 * - ForwardProgress: the device's further-advanced state wins
 * - DispatcherAuthority: the server (dispatcher) demotion wins
 */
enum class DemotionPolicy {
    ForwardProgress,
    DispatcherAuthority
};

enum class StatusDecision {
    Unchanged,
    ServerWins,
    LocalWins,
    TerminalWins,
    Conflict
};

struct StatusMergeResult {
    StatusDecision decision = StatusDecision::Unchanged;
    model::LifecycleStatus resolved = model::LifecycleStatus::Pending; ///< Server status when decision == Conflict
    bool requires_user_choice = false;
};

/**
 * @brief Merges the lifecycle status of one entity
 *
 * RULES (in order):
 * 1. Equal statuses: Unchanged
 * 2. Completed on one side, Cancelled on the other: Conflict, user must choose
 * 3. One side terminal, the other in progression: the terminal side wins
 * 4. Both in progression: the higher progression index wins
 *
 * Every switch in the implementation covers the closed status enum without a
 * default branch, so a new status does not compile until it is placed.
 */
class StatusReconciler {
public:
    explicit StatusReconciler(DemotionPolicy policy = DemotionPolicy::ForwardProgress) noexcept
        : policy_(policy) {}

    [[nodiscard]] StatusMergeResult merge(model::LifecycleStatus server,
                                          model::LifecycleStatus local) const noexcept;

    /// Whether the device may append a transition from one status to another
    [[nodiscard]] static bool is_valid_transition(model::LifecycleStatus from,
                                                  model::LifecycleStatus to) noexcept;

    [[nodiscard]] static bool is_terminal(model::LifecycleStatus status) noexcept;

    /// Position in the progression; terminal statuses rank above every progression state
    [[nodiscard]] static int progression_index(model::LifecycleStatus status) noexcept;

    [[nodiscard]] DemotionPolicy policy() const noexcept { return policy_; }

private:
    [[nodiscard]] StatusMergeResult merge_progression(model::LifecycleStatus server,
                                                      model::LifecycleStatus local) const noexcept;

    DemotionPolicy policy_;
};

std::string to_string(StatusDecision decision);

} // namespace orc::sync
