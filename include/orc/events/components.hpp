/**
 * @file components.hpp
 * @brief Ready-made subscribers for coordinator events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "orc/events/event_bus.hpp"
#include "orc/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace orc::events {

/**
 * @brief Logs every coordinator event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) { on_sync_started(e); });
        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) { on_sync_completed(e); });
        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent& e) { on_sync_failed(e); });
        bus_.subscribe<SyncCancelledEvent>([this](const SyncCancelledEvent& e) { on_sync_cancelled(e); });
        bus_.subscribe<ConnectivityChangedEvent>([this](const ConnectivityChangedEvent& e) {
            on_connectivity_changed(e);
        });
        bus_.subscribe<ConflictDetectedEvent>([this](const ConflictDetectedEvent& e) { on_conflict_detected(e); });
        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent& e) { on_conflict_resolved(e); });
        bus_.subscribe<StaleConflictOverriddenEvent>([this](const StaleConflictOverriddenEvent& e) {
            on_stale_conflict(e);
        });
        bus_.subscribe<SupportEscalationEvent>([this](const SupportEscalationEvent& e) { on_escalation(e); });
        bus_.subscribe<QueueFullEvent>([this](const QueueFullEvent& e) { on_queue_full(e); });
        bus_.subscribe<EntityIdReassignedEvent>([this](const EntityIdReassignedEvent& e) { on_id_reassigned(e); });
    }

private:
    void on_sync_started(const SyncStartedEvent& e) {
        spdlog::info("[SyncStarted] session={} entity={} pending={}", e.session_id, e.entity_id, e.pending_entries);
    }

    void on_sync_completed(const SyncCompletedEvent& e) {
        spdlog::info("[SyncCompleted] session={} entity={} pushed={} conflicts={} duration={}ms",
                     e.session_id, e.entity_id, e.entries_pushed, e.conflicts, e.duration.count());
    }

    void on_sync_failed(const SyncFailedEvent& e) {
        spdlog::error("[SyncFailed] session={} entity={} failed_entries={} error={}",
                      e.session_id, e.entity_id, e.failed_entries, e.error_message);
    }

    void on_sync_cancelled(const SyncCancelledEvent& e) {
        spdlog::info("[SyncCancelled] session={} entity={} reason={}", e.session_id, e.entity_id, e.reason);
    }

    void on_connectivity_changed(const ConnectivityChangedEvent& e) {
        spdlog::info("[Connectivity] {}", e.online ? "online" : "offline");
    }

    void on_conflict_detected(const ConflictDetectedEvent& e) {
        spdlog::warn("[ConflictDetected] session={} entity={} field={} kind={} server='{}' local='{}'",
                     e.session_id, e.conflict.entity_id, e.conflict.field, model::to_string(e.conflict.kind),
                     e.conflict.server_value, e.conflict.local_value);
    }

    void on_conflict_resolved(const ConflictResolvedEvent& e) {
        spdlog::info("[ConflictResolved] conflict={} choice={}", e.conflict.conflict_id,
                     e.choice == model::ResolutionChoice::KeepLocal ? "keep_local" : "keep_server");
    }

    void on_stale_conflict(const StaleConflictOverriddenEvent& e) {
        spdlog::warn("[StaleConflict] conflict={} age={}ms resolved to server value, discarded local='{}'",
                     e.conflict.conflict_id, e.age.count(), e.conflict.local_value);
    }

    void on_escalation(const SupportEscalationEvent& e) {
        if (e.degraded) {
            spdlog::error("[SupportEscalation] {} unresolved conflicts exceed threshold {}",
                          e.unresolved_conflicts, e.threshold);
        } else {
            spdlog::info("[SupportEscalation] cleared, {} unresolved conflicts", e.unresolved_conflicts);
        }
    }

    void on_queue_full(const QueueFullEvent& e) {
        spdlog::warn("[QueueFull] entity={} capacity={}", e.entity_id, e.capacity);
    }

    void on_id_reassigned(const EntityIdReassignedEvent& e) {
        spdlog::info("[IdReassigned] {} -> {}", e.temporary_id, e.server_id);
    }

    EventBus& bus_;
};

/**
 * @brief Counts coordinator activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().conflicts_detected.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> passes_started{0};
        std::atomic<uint64_t> passes_completed{0};
        std::atomic<uint64_t> passes_failed{0};
        std::atomic<uint64_t> passes_cancelled{0};
        std::atomic<uint64_t> entries_pushed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
        std::atomic<uint64_t> stale_overrides{0};
        std::atomic<uint64_t> queue_full_rejections{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent&) { stats_.passes_started++; });
        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.passes_completed++;
            stats_.entries_pushed += e.entries_pushed;
        });
        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) { stats_.passes_failed++; });
        bus_.subscribe<SyncCancelledEvent>([this](const SyncCancelledEvent&) { stats_.passes_cancelled++; });
        bus_.subscribe<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) { stats_.conflicts_detected++; });
        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) { stats_.conflicts_resolved++; });
        bus_.subscribe<StaleConflictOverriddenEvent>([this](const StaleConflictOverriddenEvent&) {
            stats_.stale_overrides++;
        });
        bus_.subscribe<QueueFullEvent>([this](const QueueFullEvent&) { stats_.queue_full_rejections++; });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Passes started:   {}", stats_.passes_started.load());
        spdlog::info("  Passes completed: {}", stats_.passes_completed.load());
        spdlog::info("  Passes failed:    {}", stats_.passes_failed.load());
        spdlog::info("  Passes cancelled: {}", stats_.passes_cancelled.load());
        spdlog::info("  Entries pushed:   {}", stats_.entries_pushed.load());
        spdlog::info("  Conflicts det.:   {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:   {}", stats_.conflicts_resolved.load());
        spdlog::info("  Stale overrides:  {}", stats_.stale_overrides.load());
        spdlog::info("  Queue full:       {}", stats_.queue_full_rejections.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace orc::events
