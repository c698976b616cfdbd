#include "orc/sync/status_reconciler.hpp"

namespace orc::sync {
namespace {

using model::LifecycleStatus;

enum class Terminal {
    None,
    Completion,
    Cancellation
};

Terminal classify(LifecycleStatus status) noexcept {
    switch (status) {
        case LifecycleStatus::Pending:
        case LifecycleStatus::Assigned:
        case LifecycleStatus::EnRoute:
        case LifecycleStatus::InProgress:
            return Terminal::None;
        case LifecycleStatus::Completed:
            return Terminal::Completion;
        case LifecycleStatus::Cancelled:
            return Terminal::Cancellation;
    }
    return Terminal::None;
}

StatusMergeResult terminal_wins(LifecycleStatus terminal) noexcept {
    return StatusMergeResult{StatusDecision::TerminalWins, terminal, false};
}

StatusMergeResult irreconcilable(LifecycleStatus server) noexcept {
    return StatusMergeResult{StatusDecision::Conflict, server, true};
}

} // namespace

StatusMergeResult StatusReconciler::merge(LifecycleStatus server, LifecycleStatus local) const noexcept {
    if (server == local) {
        return StatusMergeResult{StatusDecision::Unchanged, server, false};
    }

    switch (classify(server)) {
        case Terminal::None:
            switch (classify(local)) {
                case Terminal::None:
                    return merge_progression(server, local);
                case Terminal::Completion:
                case Terminal::Cancellation:
                    return terminal_wins(local);
            }
            break;
        case Terminal::Completion:
            switch (classify(local)) {
                case Terminal::None:
                    return terminal_wins(server);
                case Terminal::Completion:
                    return StatusMergeResult{StatusDecision::Unchanged, server, false};
                case Terminal::Cancellation:
                    return irreconcilable(server);
            }
            break;
        case Terminal::Cancellation:
            switch (classify(local)) {
                case Terminal::None:
                    return terminal_wins(server);
                case Terminal::Completion:
                    return irreconcilable(server);
                case Terminal::Cancellation:
                    return StatusMergeResult{StatusDecision::Unchanged, server, false};
            }
            break;
    }
    return irreconcilable(server);
}

StatusMergeResult StatusReconciler::merge_progression(LifecycleStatus server,
                                                      LifecycleStatus local) const noexcept {
    const int server_index = progression_index(server);
    const int local_index = progression_index(local);

    if (server_index > local_index) {
        return StatusMergeResult{StatusDecision::ServerWins, server, false};
    }

    // Server is behind the device. Before work starts this may be a deliberate dispatcher demotion.
    const bool before_work = local_index < progression_index(LifecycleStatus::InProgress);
    switch (policy_) {
        case DemotionPolicy::ForwardProgress:
            return StatusMergeResult{StatusDecision::LocalWins, local, false};
        case DemotionPolicy::DispatcherAuthority:
            if (before_work) {
                return StatusMergeResult{StatusDecision::ServerWins, server, false};
            }
            return StatusMergeResult{StatusDecision::LocalWins, local, false};
    }
    return StatusMergeResult{StatusDecision::LocalWins, local, false};
}

bool StatusReconciler::is_valid_transition(LifecycleStatus from, LifecycleStatus to) noexcept {
    if (from == to || is_terminal(from)) {
        return false;
    }

    switch (to) {
        case LifecycleStatus::Pending:
        case LifecycleStatus::Assigned:
        case LifecycleStatus::EnRoute:
        case LifecycleStatus::InProgress:
            return progression_index(to) > progression_index(from);
        case LifecycleStatus::Completed:
            return from == LifecycleStatus::InProgress;
        case LifecycleStatus::Cancelled:
            return true;
    }
    return false;
}

bool StatusReconciler::is_terminal(LifecycleStatus status) noexcept {
    return classify(status) != Terminal::None;
}

int StatusReconciler::progression_index(LifecycleStatus status) noexcept {
    switch (status) {
        case LifecycleStatus::Pending: return 0;
        case LifecycleStatus::Assigned: return 1;
        case LifecycleStatus::EnRoute: return 2;
        case LifecycleStatus::InProgress: return 3;
        case LifecycleStatus::Completed: return 4;
        case LifecycleStatus::Cancelled: return 4;
    }
    return 0;
}

std::string to_string(StatusDecision decision) {
    switch (decision) {
        case StatusDecision::Unchanged: return "unchanged";
        case StatusDecision::ServerWins: return "server_wins";
        case StatusDecision::LocalWins: return "local_wins";
        case StatusDecision::TerminalWins: return "terminal_wins";
        case StatusDecision::Conflict: return "conflict";
    }
    return "unknown";
}

} // namespace orc::sync
