#pragma once

#include "orc/core/result.hpp"
#include "orc/model/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace orc::sync {

enum class SessionState {
    Idle,
    FetchingSnapshot,
    Reconciling,
    Pushing,
    Committing,
    Complete,
    Failed,
    Cancelled
};

std::string to_string(SessionState state);

/**
 * @brief Summary of an active or finished reconciliation pass
 */
struct SyncSessionInfo {
    std::string session_id;
    std::string entity_id;
    std::string device_id;
    model::Timestamp started_at = 0;
    SessionState state = SessionState::Idle;
    std::size_t entries_pending = 0;
    std::size_t entries_pushed = 0;
    std::size_t conflicts_found = 0;
    std::size_t transport_attempts = 0;
    std::string last_error; ///< Populated when state == Failed or Cancelled
};

/// Shared flag flipped by the coordinator when connectivity drops mid-pass
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief State of one reconciliation pass for one entity
 *
 * Owned by the coordinator for the duration of the pass and handed to the
 * reconciliation engine by reference. Nothing about a pass lives in globals.
 */
class SyncSession {
public:
    SyncSession(std::string session_id, std::string entity_id, std::string device_id,
                CancellationToken cancel_token = std::make_shared<std::atomic<bool>>(false));

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] const std::string& entity_id() const noexcept { return info_.entity_id; }
    [[nodiscard]] const std::string& device_id() const noexcept { return info_.device_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SyncSessionInfo& info() const noexcept { return info_; }

    Result<void> start(std::size_t entries_pending, model::Timestamp now);
    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);
    Result<void> mark_cancelled(std::string reason);

    void record_attempt() noexcept { ++info_.transport_attempts; }
    void record_conflicts(std::size_t count) noexcept { info_.conflicts_found = count; }
    void record_pushed(std::size_t count) noexcept { info_.entries_pushed = count; }

    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_token_ && cancel_token_->load(); }
    [[nodiscard]] const CancellationToken& cancel_token() const noexcept { return cancel_token_; }

    [[nodiscard]] bool finished() const noexcept;

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SyncSessionInfo info_;
    CancellationToken cancel_token_;
};

} // namespace orc::sync
