#include "orc/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace orc::sync {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::FetchingSnapshot}},
        {SessionState::FetchingSnapshot, {SessionState::Reconciling}},
        {SessionState::Reconciling, {SessionState::Pushing, SessionState::Committing}},
        {SessionState::Pushing, {SessionState::Committing}},
        {SessionState::Committing, {SessionState::Complete}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

SyncSession::SyncSession(std::string session_id, std::string entity_id, std::string device_id,
                         CancellationToken cancel_token)
    : cancel_token_(std::move(cancel_token)) {
    info_.session_id = std::move(session_id);
    info_.entity_id = std::move(entity_id);
    info_.device_id = std::move(device_id);
    info_.state = SessionState::Idle;
}

Result<void> SyncSession::start(std::size_t entries_pending, model::Timestamp now) {
    if (info_.state != SessionState::Idle) {
        return Err<void>(ErrorCode::InvalidState, "Session already started");
    }
    info_.started_at = now;
    info_.entries_pending = entries_pending;
    return transition_to(SessionState::FetchingSnapshot);
}

Result<void> SyncSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidTransition,
                         "Illegal session transition " + to_string(info_.state) + " -> " + to_string(next_state));
    }

    info_.state = next_state;
    if (next_state != SessionState::Failed && next_state != SessionState::Cancelled) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> SyncSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(SessionState::Failed);
}

Result<void> SyncSession::mark_cancelled(std::string reason) {
    info_.last_error = std::move(reason);
    return transition_to(SessionState::Cancelled);
}

bool SyncSession::finished() const noexcept {
    return info_.state == SessionState::Complete || info_.state == SessionState::Failed ||
           info_.state == SessionState::Cancelled;
}

bool SyncSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (finished()) {
        return false;
    }

    return is_progressive(info_.state, target);
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::FetchingSnapshot: return "fetching_snapshot";
        case SessionState::Reconciling: return "reconciling";
        case SessionState::Pushing: return "pushing";
        case SessionState::Committing: return "committing";
        case SessionState::Complete: return "complete";
        case SessionState::Failed: return "failed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace orc::sync
