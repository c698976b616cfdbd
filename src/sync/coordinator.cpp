#include "orc/sync/coordinator.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <thread>

namespace orc::sync {

using model::ChangeLogEntry;
using model::ConflictRecord;
using model::DeliveryState;
using model::Entity;
using model::MutationKind;
using model::ResolutionChoice;

namespace {

bool entry_touches(const ChangeLogEntry& entry, const std::string& field) {
    if (field == model::kStatusField) {
        return entry.kind == MutationKind::StatusTransition;
    }
    return entry.kind == MutationKind::FieldUpdate && entry.target == field;
}

bool is_temporary_id(const std::string& entity_id) {
    return entity_id.rfind(model::kTemporaryIdPrefix, 0) == 0;
}

} // namespace

// ════════════════════════════════════════════════════════
// PassClaim
// ════════════════════════════════════════════════════════

SyncCoordinator::PassClaim::PassClaim(SyncCoordinator& owner, std::string entity_id)
    : owner_(owner), entity_id_(std::move(entity_id)) {}

SyncCoordinator::PassClaim::~PassClaim() {
    std::lock_guard lock(owner_.mutex_);
    owner_.active_passes_.erase(entity_id_);
}

void SyncCoordinator::PassClaim::rename(const std::string& new_entity_id) {
    std::lock_guard lock(owner_.mutex_);
    auto node = owner_.active_passes_.extract(entity_id_);
    if (!node.empty()) {
        node.key() = new_entity_id;
        owner_.active_passes_.insert(std::move(node));
    }
    entity_id_ = new_entity_id;
}

// ════════════════════════════════════════════════════════
// Construction
// ════════════════════════════════════════════════════════

model::Timestamp SyncCoordinator::system_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SyncCoordinator::SyncCoordinator(EngineConfig config,
                                 Transport& transport,
                                 ChangeLog& change_log,
                                 EntitySnapshotStore& store,
                                 events::EventBus& bus,
                                 Clock clock,
                                 Sleeper sleeper)
    : config_(std::move(config)),
      transport_(transport),
      change_log_(change_log),
      store_(store),
      event_bus_(bus),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)),
      engine_(FieldResolutionRules(StatusReconciler(config_.demotion_policy))),
      retry_policy_(RetryPolicy::from_config(config_)) {
    if (!clock_) {
        clock_ = &SyncCoordinator::system_now;
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

// ════════════════════════════════════════════════════════
// Local edits
// ════════════════════════════════════════════════════════

Result<std::string> SyncCoordinator::create_entity(Entity entity) {
    const auto now = clock_();
    if (entity.id.empty()) {
        entity.id = std::string(model::kTemporaryIdPrefix) + config_.device_id + "-" + std::to_string(now) + "-" +
                    std::to_string(++temp_id_counter_);
    }

    std::vector<ChangeLogEntry> entries;
    auto make_entry = [&](MutationKind kind, const std::string& target, const std::string& payload) {
        ChangeLogEntry entry;
        entry.entity_id = entity.id;
        entry.entity_type = entity.type;
        entry.kind = kind;
        entry.target = target;
        entry.payload = payload;
        entry.device_id = config_.device_id;
        entry.created_at = now;
        entries.push_back(std::move(entry));
    };
    for (const auto& [field, value] : entity.fields) {
        make_entry(MutationKind::FieldUpdate, field, value);
    }
    if (entity.status != model::LifecycleStatus::Pending) {
        make_entry(MutationKind::StatusTransition, model::kStatusField, model::to_string(entity.status));
    }
    for (const auto& [collection, items] : entity.collections) {
        for (const auto& item : items) {
            make_entry(MutationKind::CollectionAppend, collection, item.content);
        }
    }

    Result<std::string> created = Ok(entity.id);
    {
        std::lock_guard edit_lock(working_copy_mutex_);
        if (store_.contains(entity.id)) {
            return Err<std::string>(ErrorCode::InvalidState, "Entity " + entity.id + " already exists");
        }
        // All or nothing: a half-logged record would reach the server incomplete
        if (change_log_.live_count() + entries.size() > change_log_.capacity()) {
            created = Err<std::string>(ErrorCode::QueueFull,
                                       "Change log cannot hold the " + std::to_string(entries.size()) +
                                       " entries of " + entity.id);
        } else {
            for (auto& entry : entries) {
                auto appended = change_log_.append(std::move(entry));
                if (appended.is_error()) {
                    created = Err<std::string>(appended.error());
                    break;
                }
            }
        }
        if (created.is_ok()) {
            entity.server_updated_at = 0;
            entity.local_updated_at = now;
            auto stored = store_.put_local(entity);
            if (stored.is_error()) {
                created = Err<std::string>(stored.error());
            }
        }
    }

    if (created.is_ok()) {
        spdlog::debug("Created {} {} with {} change log entries", model::to_string(entity.type), entity.id,
                      entries.size());
    }
    return report_queue_full(entity.id, std::move(created));
}

Result<std::string> SyncCoordinator::record_field_update(const std::string& entity_id,
                                                         const std::string& field,
                                                         const std::string& value) {
    if (field == model::kStatusField) {
        return Err<std::string>(ErrorCode::InvalidState, "Status changes go through record_status_transition");
    }
    return edit_local(entity_id, [&](Entity& entity, ChangeLogEntry& entry) -> Result<void> {
        entry.kind = MutationKind::FieldUpdate;
        entry.target = field;
        entry.payload = value;
        entity.fields[field] = value;
        return Ok();
    });
}

Result<std::string> SyncCoordinator::record_status_transition(const std::string& entity_id,
                                                              model::LifecycleStatus status) {
    return edit_local(entity_id, [&](Entity& entity, ChangeLogEntry& entry) -> Result<void> {
        if (!StatusReconciler::is_valid_transition(entity.status, status)) {
            return Err<void>(ErrorCode::InvalidTransition,
                             "Cannot move " + entity.id + " from " + model::to_string(entity.status) + " to " +
                             model::to_string(status));
        }
        entry.kind = MutationKind::StatusTransition;
        entry.target = model::kStatusField;
        entry.payload = model::to_string(status);
        entity.status = status;
        return Ok();
    });
}

Result<std::string> SyncCoordinator::record_collection_append(const std::string& entity_id,
                                                              const std::string& collection,
                                                              const std::string& content) {
    return edit_local(entity_id, [&](Entity& entity, ChangeLogEntry& entry) -> Result<void> {
        entry.kind = MutationKind::CollectionAppend;
        entry.target = collection;
        entry.payload = content;

        model::CollectionItem item(content, config_.device_id, entry.created_at);
        auto& items = entity.collections[collection];
        const auto key = item.content_key();
        const bool present = std::any_of(items.begin(), items.end(), [&key](const model::CollectionItem& existing) {
            return existing.content_key() == key;
        });
        if (!present) {
            items.push_back(std::move(item));
        }
        return Ok();
    });
}

Result<std::string> SyncCoordinator::edit_local(const std::string& entity_id, const LocalEdit& edit) {
    Result<std::string> appended = Ok(std::string{});
    {
        std::lock_guard edit_lock(working_copy_mutex_);
        auto local = store_.local(entity_id);
        if (local.is_error()) {
            return Err<std::string>(local.error());
        }
        Entity entity = std::move(local.value());

        ChangeLogEntry entry;
        entry.entity_id = entity.id;
        entry.entity_type = entity.type;
        entry.device_id = config_.device_id;
        entry.created_at = clock_();

        auto edited = edit(entity, entry);
        if (edited.is_error()) {
            return Err<std::string>(edited.error());
        }

        entity.local_updated_at = entry.created_at;
        appended = change_log_.append(std::move(entry));
        if (appended.is_ok()) {
            auto stored = store_.put_local(entity);
            if (stored.is_error()) {
                return Err<std::string>(stored.error());
            }
        }
    }
    return report_queue_full(entity_id, std::move(appended));
}

Result<std::string> SyncCoordinator::report_queue_full(const std::string& entity_id, Result<std::string> appended) {
    if (appended.is_error() && appended.error().code == ErrorCode::QueueFull) {
        event_bus_.emit(events::QueueFullEvent{entity_id, change_log_.capacity()});
    }
    return appended;
}

// ════════════════════════════════════════════════════════
// Passes
// ════════════════════════════════════════════════════════

Result<SyncSessionInfo> SyncCoordinator::trigger_sync(const std::string& entity_id) {
    if (!online_.load()) {
        return Err<SyncSessionInfo>(ErrorCode::TransportError, "Device offline, no pass for " + entity_id);
    }

    auto token = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard lock(mutex_);
        if (!active_passes_.emplace(entity_id, token).second) {
            return Err<SyncSessionInfo>(ErrorCode::PassInProgress, "A pass for " + entity_id + " is already running");
        }
    }
    PassClaim claim(*this, entity_id);

    // set_online(false) may have run between the first check and the claim
    if (!online_.load()) {
        token->store(true);
    }
    return run_pass(entity_id, token, claim);
}

Result<SyncSessionInfo> SyncCoordinator::run_pass(const std::string& entity_id,
                                                  const CancellationToken& token,
                                                  PassClaim& claim) {
    const auto started = std::chrono::steady_clock::now();
    SyncSession session("pass-" + std::to_string(++session_counter_), entity_id, config_.device_id, token);

    auto pending = change_log_.drain(entity_id);
    if (auto begun = session.start(pending.size(), clock_()); begun.is_error()) {
        return Err<SyncSessionInfo>(begun.error());
    }
    event_bus_.emit(events::SyncStartedEvent{session.session_id(), entity_id, pending.size()});

    const RetryPolicy::CancelCheck cancelled = [&session]() { return session.cancel_requested(); };
    const std::function<void(std::size_t)> count_attempt = [&session](std::size_t attempt) {
        session.record_attempt();
        if (attempt > 1) {
            spdlog::debug("Pass {} retrying transport call (attempt {})", session.session_id(), attempt);
        }
    };

    // Server snapshot; NotFound means the server has never seen this entity
    std::optional<Entity> server;
    auto fetched = retry_policy_.execute<Entity>(
        [this, &entity_id]() { return transport_.fetch_snapshot(entity_id); }, sleeper_, cancelled, count_attempt);
    if (fetched.is_ok()) {
        server = std::move(fetched.value());
    } else if (fetched.error().code == ErrorCode::Cancelled) {
        return cancel_pass(session, {});
    } else if (fetched.error().code != ErrorCode::NotFound || !store_.contains(entity_id)) {
        return fail_pass(session, pending, fetched.error());
    }

    if (session.cancel_requested()) {
        return cancel_pass(session, {});
    }

    // Merge and commit
    std::optional<Error> failure;
    std::vector<ConflictRecord> fresh_conflicts;
    std::vector<ChangeLogEntry> to_push;
    {
        std::lock_guard edit_lock(working_copy_mutex_);
        const auto now = clock_();

        // Edits recorded while the snapshot was in transit belong to this pass
        pending = change_log_.drain(entity_id);
        auto local = store_.local(entity_id);

        ReconciliationResult reconciled;
        if (server) {
            auto merged = engine_.reconcile(session, *server, local.is_ok() ? local.value() : *server, pending);
            if (merged.is_ok()) {
                reconciled = std::move(merged.value());
            } else {
                failure = merged.error();
            }
        } else if (local.is_error()) {
            failure = local.error();
        } else if (auto moved = session.transition_to(SessionState::Reconciling); moved.is_error()) {
            failure = moved.error();
        } else {
            reconciled.merged = local.value();
        }

        if (!failure) {
            auto routed = route_entries(pending, reconciled, now);
            if (routed.is_ok()) {
                to_push = std::move(routed.value());
            } else {
                failure = routed.error();
            }
        }

        if (!failure) {
            fresh_conflicts = register_conflicts(reconciled.conflicts, now);
            {
                std::lock_guard lock(mutex_);
                reconciled.merged.needs_resolution = has_open_conflicts_locked(entity_id);
            }
            auto committed = store_.commit(server, reconciled.merged);
            if (committed.is_error()) {
                failure = committed.error();
            }
        }
    }

    if (failure) {
        return fail_pass(session, pending, *failure);
    }

    for (const auto& conflict : fresh_conflicts) {
        event_bus_.emit(events::ConflictDetectedEvent{conflict, session.session_id()});
    }
    if (!fresh_conflicts.empty()) {
        update_degraded_mode();
    }

    if (session.cancel_requested()) {
        return cancel_pass(session, {});
    }

    // Push what is not parked behind a conflict
    std::size_t pushed = 0;
    std::size_t rejected = 0;
    std::string server_entity_id;
    if (!to_push.empty()) {
        if (auto moved = session.transition_to(SessionState::Pushing); moved.is_error()) {
            return fail_pass(session, to_push, moved.error());
        }
        const auto now = clock_();
        for (const auto& entry : to_push) {
            if (auto marked = change_log_.mark_in_flight(entry.entry_id, now); marked.is_error()) {
                return fail_pass(session, to_push, marked.error());
            }
        }

        auto acks = retry_policy_.execute<std::vector<PushAck>>(
            [this, &to_push]() { return transport_.push_entries(to_push); }, sleeper_, cancelled, count_attempt);
        if (acks.is_error()) {
            if (acks.error().code == ErrorCode::Cancelled) {
                return cancel_pass(session, to_push);
            }
            return fail_pass(session, to_push, acks.error());
        }

        if (auto moved = session.transition_to(SessionState::Committing); moved.is_error()) {
            return fail_pass(session, to_push, moved.error());
        }

        std::unordered_map<std::string, const PushAck*> by_entry;
        for (const auto& ack : acks.value()) {
            by_entry[ack.entry_id] = &ack;
            if (!ack.server_entity_id.empty()) {
                server_entity_id = ack.server_entity_id;
            }
        }

        const auto acked_at = clock_();
        for (const auto& entry : to_push) {
            auto it = by_entry.find(entry.entry_id);
            Result<void> marked = Ok();
            if (it == by_entry.end()) {
                // No verdict: send again next pass
                marked = change_log_.release(entry.entry_id, acked_at);
            } else if (it->second->accepted) {
                marked = change_log_.mark_delivered(entry.entry_id, acked_at);
                ++pushed;
            } else {
                spdlog::warn("Server rejected entry {} ({} {}): {}", entry.entry_id, model::to_string(entry.kind),
                             entry.target, it->second->message);
                marked = change_log_.mark_failed(entry.entry_id, acked_at);
                ++rejected;
            }
            if (marked.is_error()) {
                spdlog::warn("Could not record ack for {}: {}", entry.entry_id, describe(marked.error()));
            }
        }
        session.record_pushed(pushed);
    } else if (auto moved = session.transition_to(SessionState::Committing); moved.is_error()) {
        return fail_pass(session, {}, moved.error());
    }

    // First push of a locally created entity: adopt the server id
    std::string final_id = entity_id;
    if (!server_entity_id.empty() && server_entity_id != entity_id && is_temporary_id(entity_id)) {
        if (auto reassigned = reassign_id(entity_id, server_entity_id); reassigned.is_error()) {
            return fail_pass(session, {}, reassigned.error());
        }
        claim.rename(server_entity_id);
        final_id = server_entity_id;
    }

    if (auto moved = session.transition_to(SessionState::Complete); moved.is_error()) {
        return fail_pass(session, {}, moved.error());
    }

    const auto finished_at = clock_();
    const auto collected = change_log_.collect_garbage(finished_at);
    if (collected > 0) {
        spdlog::debug("Collected {} delivered change log entries", collected);
    }

    {
        std::lock_guard lock(mutex_);
        if (rejected > 0) {
            failed_entities_.insert(final_id);
        } else {
            failed_entities_.erase(final_id);
        }
        last_sync_at_ = finished_at;
    }
    finish_session(session);

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(events::SyncCompletedEvent{session.session_id(), final_id, pushed,
                                               session.info().conflicts_found, duration});
    if (rejected > 0) {
        event_bus_.emit(events::SyncFailedEvent{session.session_id(), final_id,
                                                "Server rejected " + std::to_string(rejected) + " entries",
                                                rejected});
    }
    return Ok(session.info());
}

Result<std::vector<ChangeLogEntry>> SyncCoordinator::route_entries(const std::vector<ChangeLogEntry>& pending,
                                                                    const ReconciliationResult& reconciled,
                                                                    model::Timestamp now) {
    // An entity the server has never seen has no audit trail: everything goes out
    std::map<std::string, FieldOutcome::Kind> outcomes;
    for (const auto& line : reconciled.audit) {
        outcomes[line.field] = line.outcome;
    }

    std::vector<ChangeLogEntry> to_push;
    std::set<std::string> replaced;
    for (const auto& entry : pending) {
        const std::string target =
            entry.kind == MutationKind::StatusTransition ? std::string(model::kStatusField) : entry.target;
        auto it = outcomes.find(target);
        if (entry.kind == MutationKind::CollectionAppend || it == outcomes.end()) {
            to_push.push_back(entry);
            continue;
        }

        switch (it->second) {
            case FieldOutcome::Kind::UseLocal:
                to_push.push_back(entry);
                break;

            case FieldOutcome::Kind::Conflict:
                if (auto marked = change_log_.mark_conflicted(entry.entry_id, now); marked.is_error()) {
                    return Err<std::vector<ChangeLogEntry>>(marked.error());
                }
                break;

            case FieldOutcome::Kind::UseServer:
                if (auto marked = change_log_.mark_superseded(entry.entry_id, now); marked.is_error()) {
                    return Err<std::vector<ChangeLogEntry>>(marked.error());
                }
                spdlog::debug("Entry {} ({} {}) lost to the server value", entry.entry_id,
                              model::to_string(entry.kind), target);
                break;

            case FieldOutcome::Kind::Merged: {
                if (auto marked = change_log_.mark_superseded(entry.entry_id, now); marked.is_error()) {
                    return Err<std::vector<ChangeLogEntry>>(marked.error());
                }
                if (!replaced.insert(target).second) {
                    break;
                }
                ChangeLogEntry merged;
                merged.entity_id = entry.entity_id;
                merged.entity_type = entry.entity_type;
                merged.kind = MutationKind::FieldUpdate;
                merged.target = target;
                merged.payload = reconciled.merged.field_or(target);
                merged.device_id = config_.device_id;
                merged.created_at = now;
                auto appended = change_log_.append(std::move(merged));
                if (appended.is_error()) {
                    return Err<std::vector<ChangeLogEntry>>(appended.error());
                }
                auto stored = change_log_.find(appended.value());
                if (stored.is_error()) {
                    return Err<std::vector<ChangeLogEntry>>(stored.error());
                }
                to_push.push_back(std::move(stored.value()));
                break;
            }
        }
    }
    return Ok(std::move(to_push));
}

Result<SyncSessionInfo> SyncCoordinator::fail_pass(SyncSession& session,
                                                   const std::vector<ChangeLogEntry>& entries,
                                                   const Error& error) {
    const auto now = clock_();
    std::size_t failed = 0;
    for (const auto& entry : entries) {
        auto marked = change_log_.mark_failed(entry.entry_id, now);
        if (marked.is_ok()) {
            ++failed;
        } else {
            spdlog::warn("Could not mark entry {} failed: {}", entry.entry_id, describe(marked.error()));
        }
    }

    const auto message = describe(error);
    if (auto marked = session.mark_failed(message); marked.is_error()) {
        spdlog::warn("Pass {} already finished: {}", session.session_id(), describe(marked.error()));
    }
    {
        std::lock_guard lock(mutex_);
        if (failed > 0 || error.code == ErrorCode::TransportError) {
            failed_entities_.insert(session.entity_id());
        }
    }
    finish_session(session);

    event_bus_.emit(events::SyncFailedEvent{session.session_id(), session.entity_id(), message, failed});

    const auto code = error.code == ErrorCode::TransportError ? ErrorCode::SyncFailed : error.code;
    return Err<SyncSessionInfo>(code, "Pass " + session.session_id() + " for " + session.entity_id() +
                                      " failed: " + error.message);
}

Result<SyncSessionInfo> SyncCoordinator::cancel_pass(SyncSession& session,
                                                     const std::vector<ChangeLogEntry>& in_flight) {
    const auto now = clock_();
    for (const auto& entry : in_flight) {
        if (auto released = change_log_.release(entry.entry_id, now); released.is_error()) {
            spdlog::warn("Could not release entry {}: {}", entry.entry_id, describe(released.error()));
        }
    }

    const std::string reason = "connectivity lost";
    if (auto marked = session.mark_cancelled(reason); marked.is_error()) {
        spdlog::warn("Pass {} already finished: {}", session.session_id(), describe(marked.error()));
    }
    finish_session(session);

    event_bus_.emit(events::SyncCancelledEvent{session.session_id(), session.entity_id(), reason});
    return Err<SyncSessionInfo>(ErrorCode::Cancelled,
                                "Pass " + session.session_id() + " for " + session.entity_id() + " cancelled");
}

std::vector<PassOutcome> SyncCoordinator::trigger_sync_all() {
    expire_stale_conflicts();

    std::set<std::string> entity_ids;
    for (const auto& id : change_log_.entities_with_live_entries()) {
        entity_ids.insert(id);
    }
    for (const auto& id : store_.entity_ids()) {
        entity_ids.insert(id);
    }

    std::vector<PassOutcome> outcomes;
    std::mutex outcomes_mutex;
    {
        boost::asio::thread_pool pool(std::max<std::size_t>(1, config_.worker_threads));
        for (const auto& id : entity_ids) {
            boost::asio::post(pool, [this, id, &outcomes, &outcomes_mutex]() {
                auto result = trigger_sync(id);
                std::lock_guard lock(outcomes_mutex);
                outcomes.push_back(PassOutcome{id, std::move(result)});
            });
        }
        pool.join();
    }

    std::sort(outcomes.begin(), outcomes.end(), [](const PassOutcome& a, const PassOutcome& b) {
        return a.entity_id < b.entity_id;
    });
    return outcomes;
}

Result<SyncSessionInfo> SyncCoordinator::retry_failed(const std::string& entity_id) {
    const auto failed = change_log_.entries_in_state(entity_id, DeliveryState::Failed);
    for (auto entry : failed) {
        entry.entry_id.clear();
        entry.state = DeliveryState::Pending;
        auto requeued = report_queue_full(entity_id, change_log_.append(std::move(entry)));
        if (requeued.is_error()) {
            return Err<SyncSessionInfo>(requeued.error());
        }
    }
    spdlog::debug("Re-queued {} failed entries of {}", failed.size(), entity_id);

    {
        std::lock_guard lock(mutex_);
        failed_entities_.erase(entity_id);
    }
    return trigger_sync(entity_id);
}

void SyncCoordinator::set_online(bool online) {
    if (online_.exchange(online) == online) {
        return;
    }
    if (!online) {
        std::lock_guard lock(mutex_);
        for (auto& [id, token] : active_passes_) {
            token->store(true);
        }
    }
    event_bus_.emit(events::ConnectivityChangedEvent{online});
}

// ════════════════════════════════════════════════════════
// Conflicts
// ════════════════════════════════════════════════════════

std::vector<ConflictRecord> SyncCoordinator::register_conflicts(std::vector<ConflictRecord> conflicts,
                                                                model::Timestamp now) {
    std::vector<ConflictRecord> fresh;
    std::lock_guard lock(mutex_);
    for (auto& conflict : conflicts) {
        auto it = conflicts_.find(conflict.conflict_id);
        if (it != conflicts_.end()) {
            // Same conflict seen again: keep its age so it can still go stale
            conflict.detected_at = it->second.detected_at;
            it->second = conflict;
            continue;
        }
        conflict.detected_at = now;
        expired_conflicts_.erase(conflict.conflict_id);
        conflicts_.emplace(conflict.conflict_id, conflict);
        fresh.push_back(conflict);
    }
    return fresh;
}

std::vector<ConflictRecord> SyncCoordinator::pending_conflicts() const {
    std::lock_guard lock(mutex_);
    std::vector<ConflictRecord> result;
    result.reserve(conflicts_.size());
    for (const auto& [id, conflict] : conflicts_) {
        result.push_back(conflict);
    }
    return result;
}

Result<void> SyncCoordinator::resolve_conflict(const std::string& conflict_id, ResolutionChoice choice) {
    const auto now = clock_();
    ConflictRecord conflict;
    {
        std::lock_guard lock(mutex_);
        auto it = conflicts_.find(conflict_id);
        if (it == conflicts_.end()) {
            if (expired_conflicts_.count(conflict_id) > 0) {
                return Err<void>(ErrorCode::StaleConflict,
                                 "Conflict " + conflict_id + " expired and was resolved to the server value");
            }
            return Err<void>(ErrorCode::NotFound, "Unknown conflict " + conflict_id);
        }
        conflict = it->second;
    }

    if (std::chrono::milliseconds(now - conflict.detected_at) >= config_.stale_conflict_threshold) {
        auto expired = expire_conflict(conflict, now);
        update_degraded_mode();
        if (expired.is_error()) {
            return expired;
        }
        return Err<void>(ErrorCode::StaleConflict,
                         "Conflict " + conflict_id + " expired and was resolved to the server value");
    }

    auto applied = apply_resolution(conflict, choice, now);
    if (applied.is_error()) {
        if (applied.error().code == ErrorCode::QueueFull) {
            event_bus_.emit(events::QueueFullEvent{conflict.entity_id, change_log_.capacity()});
        }
        return applied;
    }

    event_bus_.emit(events::ConflictResolvedEvent{conflict, choice});
    update_degraded_mode();
    return Ok();
}

Result<void> SyncCoordinator::apply_resolution(const ConflictRecord& conflict,
                                               ResolutionChoice choice,
                                               model::Timestamp now) {
    std::lock_guard edit_lock(working_copy_mutex_);
    auto local = store_.local(conflict.entity_id);
    if (local.is_error()) {
        return Err<void>(local.error());
    }
    Entity entity = std::move(local.value());

    const bool is_status = conflict.field == model::kStatusField;
    const auto& value = choice == ResolutionChoice::KeepLocal ? conflict.local_value : conflict.server_value;

    if (is_status) {
        auto status = model::status_from_string(value);
        if (!status) {
            return Err<void>(ErrorCode::InvalidState, "Conflict " + conflict.conflict_id + " holds unknown status " + value);
        }
        entity.status = *status;
    } else {
        entity.fields[conflict.field] = value;
    }

    switch (choice) {
        case ResolutionChoice::KeepLocal: {
            ChangeLogEntry entry;
            entry.entity_id = conflict.entity_id;
            entry.entity_type = conflict.entity_type;
            entry.kind = is_status ? MutationKind::StatusTransition : MutationKind::FieldUpdate;
            entry.target = conflict.field;
            entry.payload = conflict.local_value;
            entry.device_id = config_.device_id;
            entry.created_at = now;
            entry.resolution_override = true;
            auto appended = change_log_.append(std::move(entry));
            if (appended.is_error()) {
                return Err<void>(appended.error());
            }
            break;
        }
        case ResolutionChoice::KeepServer:
            break;
    }

    for (const auto& entry : change_log_.entries_in_state(conflict.entity_id, DeliveryState::Conflicted)) {
        if (!entry_touches(entry, conflict.field)) {
            continue;
        }
        if (auto superseded = change_log_.mark_superseded(entry.entry_id, now); superseded.is_error()) {
            return superseded;
        }
    }

    {
        std::lock_guard lock(mutex_);
        conflicts_.erase(conflict.conflict_id);
        entity.needs_resolution = has_open_conflicts_locked(conflict.entity_id);
    }
    entity.local_updated_at = now;
    return store_.put_local(entity);
}

Result<void> SyncCoordinator::expire_conflict(const ConflictRecord& conflict, model::Timestamp now) {
    auto applied = apply_resolution(conflict, ResolutionChoice::KeepServer, now);
    if (applied.is_error()) {
        spdlog::error("Could not expire conflict {}: {}", conflict.conflict_id, describe(applied.error()));
        return applied;
    }
    {
        std::lock_guard lock(mutex_);
        expired_conflicts_.insert(conflict.conflict_id);
    }
    event_bus_.emit(events::StaleConflictOverriddenEvent{conflict,
                                                         std::chrono::milliseconds(now - conflict.detected_at)});
    return Ok();
}

std::size_t SyncCoordinator::expire_stale_conflicts() {
    const auto now = clock_();
    std::vector<ConflictRecord> stale;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, conflict] : conflicts_) {
            if (std::chrono::milliseconds(now - conflict.detected_at) >= config_.stale_conflict_threshold) {
                stale.push_back(conflict);
            }
        }
    }

    std::size_t expired = 0;
    for (const auto& conflict : stale) {
        if (expire_conflict(conflict, now).is_ok()) {
            ++expired;
        }
    }
    if (expired > 0) {
        update_degraded_mode();
    }
    return expired;
}

void SyncCoordinator::restore_conflicts(const std::vector<ConflictRecord>& conflicts) {
    {
        std::lock_guard lock(mutex_);
        for (const auto& conflict : conflicts) {
            conflicts_[conflict.conflict_id] = conflict;
        }
    }
    update_degraded_mode();
}

Result<void> SyncCoordinator::reassign_id(const std::string& temporary_id, const std::string& server_id) {
    {
        std::lock_guard edit_lock(working_copy_mutex_);
        if (auto rekeyed = store_.rekey(temporary_id, server_id); rekeyed.is_error()) {
            return rekeyed;
        }
        const auto moved = change_log_.rekey(temporary_id, server_id);

        std::lock_guard lock(mutex_);
        for (auto it = conflicts_.begin(); it != conflicts_.end();) {
            if (it->second.entity_id != temporary_id) {
                ++it;
                continue;
            }
            ConflictRecord conflict = it->second;
            it = conflicts_.erase(it);
            conflict.entity_id = server_id;
            conflict.conflict_id = ConflictRecord::make_id(server_id, conflict.field);
            conflicts_[conflict.conflict_id] = conflict;
        }
        if (failed_entities_.erase(temporary_id) > 0) {
            failed_entities_.insert(server_id);
        }
        auto session = last_sessions_.find(temporary_id);
        if (session != last_sessions_.end()) {
            last_sessions_[server_id] = session->second;
            last_sessions_.erase(temporary_id);
        }
        spdlog::debug("Re-keyed {} -> {} ({} change log entries)", temporary_id, server_id, moved);
    }

    event_bus_.emit(events::EntityIdReassignedEvent{temporary_id, server_id});
    return Ok();
}

bool SyncCoordinator::has_open_conflicts_locked(const std::string& entity_id) const {
    return std::any_of(conflicts_.begin(), conflicts_.end(),
                       [&entity_id](const auto& pair) { return pair.second.entity_id == entity_id; });
}

void SyncCoordinator::update_degraded_mode() {
    std::optional<events::SupportEscalationEvent> escalation;
    {
        std::lock_guard lock(mutex_);
        const bool degraded = conflicts_.size() > config_.support_conflict_threshold;
        if (degraded != degraded_) {
            degraded_ = degraded;
            escalation = events::SupportEscalationEvent{conflicts_.size(), config_.support_conflict_threshold,
                                                        degraded};
        }
    }
    if (escalation) {
        event_bus_.emit(*escalation);
    }
}

// ════════════════════════════════════════════════════════
// Status
// ════════════════════════════════════════════════════════

model::SyncStatus SyncCoordinator::sync_status(const std::string& entity_id) const {
    {
        std::lock_guard lock(mutex_);
        if (failed_entities_.count(entity_id) > 0) {
            return model::SyncStatus::Failed;
        }
        if (has_open_conflicts_locked(entity_id)) {
            return model::SyncStatus::Conflict;
        }
    }
    return change_log_.live_count(entity_id) > 0 ? model::SyncStatus::Pending : model::SyncStatus::Synced;
}

SyncSummary SyncCoordinator::summary() const {
    SyncSummary summary;
    summary.pending_operations = change_log_.live_count();
    summary.is_online = online_.load();

    std::lock_guard lock(mutex_);
    summary.is_syncing = !active_passes_.empty();
    summary.last_sync_at = last_sync_at_;
    summary.conflicts = conflicts_.size();
    summary.degraded = degraded_;
    return summary;
}

bool SyncCoordinator::degraded() const {
    std::lock_guard lock(mutex_);
    return degraded_;
}

std::optional<SyncSessionInfo> SyncCoordinator::last_session(const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto it = last_sessions_.find(entity_id);
    if (it == last_sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SyncCoordinator::finish_session(const SyncSession& session) {
    std::lock_guard lock(mutex_);
    last_sessions_[session.entity_id()] = session.info();
}

} // namespace orc::sync
