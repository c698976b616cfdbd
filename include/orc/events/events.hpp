/**
 * @file events.hpp
 * @brief Events emitted by the sync coordinator
 *
 * NAMING CONVENTION:
 * Events are past-tense: SyncCompletedEvent, ConflictDetectedEvent
 *
 * WHO SUBSCRIBES:
 * - Host application (banners, conflict screens, manual-retry buttons)
 * - LoggerComponent (spdlog)
 * - MetricsComponent (counters)
 */

#pragma once

#include "orc/model/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace orc::events {

// ════════════════════════════════════════════════════════
// Pass Events
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    std::string session_id;
    std::string entity_id;
    std::size_t pending_entries = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCompletedEvent {
    std::string session_id;
    std::string entity_id;
    std::size_t entries_pushed = 0;
    std::size_t conflicts = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Retries exhausted or unrecoverable error; the user must retry manually
 *
 * The entity's pending entries have been marked failed. Hosts show a
 * "sync failed, tap to retry" affordance wired to SyncCoordinator::retry_failed().
 */
struct SyncFailedEvent {
    std::string session_id;
    std::string entity_id;
    std::string error_message;
    std::size_t failed_entries = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Pass abandoned because connectivity dropped; entries stay pending
struct SyncCancelledEvent {
    std::string session_id;
    std::string entity_id;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConnectivityChangedEvent {
    bool online = true;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

struct ConflictDetectedEvent {
    model::ConflictRecord conflict;
    std::string session_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConflictResolvedEvent {
    model::ConflictRecord conflict;
    model::ResolutionChoice choice = model::ResolutionChoice::KeepServer;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A conflict stayed unresolved past the stale threshold
 *
 * It has been resolved to the server value. Administrators should review the
 * discarded local value.
 */
struct StaleConflictOverriddenEvent {
    model::ConflictRecord conflict;
    std::chrono::milliseconds age{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Unresolved conflicts crossed (or dropped back under) the support threshold
struct SupportEscalationEvent {
    std::size_t unresolved_conflicts = 0;
    std::size_t threshold = 0;
    bool degraded = true;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Change Log Events
// ════════════════════════════════════════════════════════

struct QueueFullEvent {
    std::string entity_id;
    std::size_t capacity = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct EntityIdReassignedEvent {
    std::string temporary_id;
    std::string server_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace orc::events
