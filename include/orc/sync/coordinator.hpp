#pragma once

/**
 * @file coordinator.hpp
 * @brief Drives reconciliation passes and owns the unresolved-conflict surface
 *
 * WHY THIS FILE EXISTS:
 * Everything below this layer is either pure (rules, reconciler, engine) or
 * a passive container (change log, snapshot store). The coordinator is where
 * time, connectivity and the network come in: it runs one pass per entity,
 * retries the transport with backoff, applies server acknowledgments and
 * keeps the list of conflicts the host has to show to the user.
 *
 * A PASS, STEP BY STEP:
 * 1. Claim the entity (a second concurrent pass fails with PassInProgress)
 * 2. Fetch the server snapshot (retried; NotFound means "new on this device")
 * 3. Drain the change log and reconcile
 * 4. Park entries touching a conflicted field as Conflicted
 * 5. Commit the merged entity to the snapshot store
 * 6. Push the remaining entries (retried), apply acks, re-key temporary ids
 * 7. Garbage-collect old terminal entries
 *
 * Retries exhausted → entries Failed + SyncFailedEvent (manual retry)
 * Connectivity lost → in-flight entries released + SyncCancelledEvent
 *
 * THREAD SAFETY:
 * Public methods may be called from any thread. Passes for different
 * entities run in parallel; the internal mutex is never held across a
 * transport call.
 */

#include "orc/core/config.hpp"
#include "orc/core/result.hpp"
#include "orc/events/event_bus.hpp"
#include "orc/events/events.hpp"
#include "orc/model/types.hpp"
#include "orc/sync/change_log.hpp"
#include "orc/sync/reconciliation_engine.hpp"
#include "orc/sync/retry_policy.hpp"
#include "orc/sync/session.hpp"
#include "orc/sync/snapshot_store.hpp"
#include "orc/sync/transport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace orc::sync {

/// Device-wide status, shown in the host's sync indicator
struct SyncSummary {
    bool is_syncing = false;
    std::optional<model::Timestamp> last_sync_at;
    std::size_t pending_operations = 0;
    std::size_t conflicts = 0;
    bool is_online = true;
    bool degraded = false;
};

/// Result of one entity's pass inside trigger_sync_all()
struct PassOutcome {
    std::string entity_id;
    Result<SyncSessionInfo> result;
};

class SyncCoordinator {
public:
    using Clock = std::function<model::Timestamp()>;
    using Sleeper = RetryPolicy::Sleeper;

    /// Wall clock in milliseconds since the Unix epoch
    static model::Timestamp system_now();

    SyncCoordinator(EngineConfig config,
                    Transport& transport,
                    ChangeLog& change_log,
                    EntitySnapshotStore& store,
                    events::EventBus& bus,
                    Clock clock = &SyncCoordinator::system_now,
                    Sleeper sleeper = {});

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    // ════════════════════════════════════════════════════
    // Local edits (append to the change log, update the working copy)
    // ════════════════════════════════════════════════════

    /**
     * @brief Register an entity created on the device
     *
     * An empty id is replaced by a "tmp-" id. Every initial field is logged as
     * a FieldUpdate so the first push carries the whole record.
     *
     * RETURNS:
     * The entity id (temporary until the server assigns one)
     */
    Result<std::string> create_entity(model::Entity entity);

    Result<std::string> record_field_update(const std::string& entity_id,
                                            const std::string& field,
                                            const std::string& value);

    /// Rejects backward transitions and anything out of a terminal status with InvalidTransition
    Result<std::string> record_status_transition(const std::string& entity_id, model::LifecycleStatus status);

    Result<std::string> record_collection_append(const std::string& entity_id,
                                                 const std::string& collection,
                                                 const std::string& content);

    // ════════════════════════════════════════════════════
    // Passes
    // ════════════════════════════════════════════════════

    Result<SyncSessionInfo> trigger_sync(const std::string& entity_id);

    /**
     * @brief Expire stale conflicts, then run one pass per known entity on the worker pool
     *
     * RETURNS:
     * One outcome per entity, ordered by entity id
     */
    std::vector<PassOutcome> trigger_sync_all();

    /// Re-queue copies of the entity's Failed entries and run a pass
    Result<SyncSessionInfo> retry_failed(const std::string& entity_id);

    /// Going offline cancels every running pass; passes started offline fail fast with TransportError
    void set_online(bool online);
    [[nodiscard]] bool is_online() const noexcept { return online_.load(); }

    // ════════════════════════════════════════════════════
    // Conflicts
    // ════════════════════════════════════════════════════

    [[nodiscard]] std::vector<model::ConflictRecord> pending_conflicts() const;

    /**
     * @brief Apply the user's decision for one conflict
     *
     * KeepLocal appends an override entry carrying the local value;
     * KeepServer restores the server value in the working copy. Either way
     * the entries parked by the conflict are superseded.
     *
     * ERRORS:
     * - NotFound: unknown conflict id
     * - StaleConflict: the conflict outlived the stale threshold and was
     *   resolved to the server value instead
     * - QueueFull: no room for the override entry (conflict stays open)
     */
    Result<void> resolve_conflict(const std::string& conflict_id, model::ResolutionChoice choice);

    /// Resolve every conflict older than the stale threshold to the server value
    std::size_t expire_stale_conflicts();

    /// Reload conflicts persisted by a previous run
    void restore_conflicts(const std::vector<model::ConflictRecord>& conflicts);

    // ════════════════════════════════════════════════════
    // Status
    // ════════════════════════════════════════════════════

    /// Failed > Conflict > Pending > Synced
    [[nodiscard]] model::SyncStatus sync_status(const std::string& entity_id) const;

    [[nodiscard]] SyncSummary summary() const;

    [[nodiscard]] bool degraded() const;

    [[nodiscard]] std::optional<SyncSessionInfo> last_session(const std::string& entity_id) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Releases the per-entity pass claim on scope exit
    class PassClaim {
    public:
        PassClaim(SyncCoordinator& owner, std::string entity_id);
        ~PassClaim();

        PassClaim(const PassClaim&) = delete;
        PassClaim& operator=(const PassClaim&) = delete;

        void rename(const std::string& new_entity_id);

    private:
        SyncCoordinator& owner_;
        std::string entity_id_;
    };

    using LocalEdit = std::function<Result<void>(model::Entity&, model::ChangeLogEntry&)>;

    Result<SyncSessionInfo> run_pass(const std::string& entity_id, const CancellationToken& token, PassClaim& claim);

    Result<SyncSessionInfo> fail_pass(SyncSession& session,
                                      const std::vector<model::ChangeLogEntry>& entries,
                                      const Error& error);

    Result<SyncSessionInfo> cancel_pass(SyncSession& session,
                                        const std::vector<model::ChangeLogEntry>& in_flight);

    /**
     * @brief Decide what each drained entry becomes after the merge
     *
     * - value kept locally, or a collection append: pushed as recorded
     * - value lost to the server: Superseded, never pushed
     * - value merged with the server's: Superseded and replaced by one entry
     *   carrying the merged value, which is pushed instead
     * - field in conflict: Conflicted until the user decides
     *
     * Called with working_copy_mutex_ held.
     */
    Result<std::vector<model::ChangeLogEntry>> route_entries(const std::vector<model::ChangeLogEntry>& pending,
                                                             const ReconciliationResult& reconciled,
                                                             model::Timestamp now);

    /// Load the working copy, let `edit` fill the entry and mutate the entity, append, store
    Result<std::string> edit_local(const std::string& entity_id, const LocalEdit& edit);

    Result<std::string> report_queue_full(const std::string& entity_id, Result<std::string> appended);

    std::vector<model::ConflictRecord> register_conflicts(std::vector<model::ConflictRecord> conflicts,
                                                          model::Timestamp now);

    Result<void> apply_resolution(const model::ConflictRecord& conflict,
                                  model::ResolutionChoice choice,
                                  model::Timestamp now);

    Result<void> expire_conflict(const model::ConflictRecord& conflict, model::Timestamp now);

    Result<void> reassign_id(const std::string& temporary_id, const std::string& server_id);

    [[nodiscard]] bool has_open_conflicts_locked(const std::string& entity_id) const;

    void update_degraded_mode();

    void finish_session(const SyncSession& session);

    EngineConfig config_;
    Transport& transport_;
    ChangeLog& change_log_;
    EntitySnapshotStore& store_;
    events::EventBus& event_bus_;
    Clock clock_;
    Sleeper sleeper_;

    ReconciliationEngine engine_;
    RetryPolicy retry_policy_;

    std::atomic<bool> online_{true};
    std::atomic<std::uint64_t> session_counter_{0};
    std::atomic<std::uint64_t> temp_id_counter_{0};

    // Serializes read-modify-write of working copies (local edits, merge + commit, resolutions).
    // Lock order: working_copy_mutex_ before mutex_.
    std::mutex working_copy_mutex_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CancellationToken> active_passes_;
    std::map<std::string, model::ConflictRecord> conflicts_;
    std::set<std::string> expired_conflicts_;
    std::set<std::string> failed_entities_;
    std::unordered_map<std::string, SyncSessionInfo> last_sessions_;
    std::optional<model::Timestamp> last_sync_at_;
    bool degraded_ = false;
};

} // namespace orc::sync
