/**
 * @file field_agent_demo.cpp
 * @brief One working day of a field technician, offline most of the time
 *
 * WHAT IT SHOWS:
 * - Edits recorded while offline, pushed once connectivity returns
 * - The dispatcher cancels a job the technician already completed:
 *   the engine parks the status change and asks the user
 * - A customer created on site receives its server id on first push
 * - State persisted to JSON so a restart resumes where it stopped
 *
 * USAGE:
 *   field_agent_demo [config.json] [state-dir]
 */

#include "orc/core/config.hpp"
#include "orc/core/logging.hpp"
#include "orc/events/components.hpp"
#include "orc/events/event_bus.hpp"
#include "orc/sync/coordinator.hpp"
#include "orc/sync/json_file_store.hpp"
#include "orc/model/json_codec.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>

using namespace orc;
using namespace orc::sync;
using namespace orc::events;
using model::Entity;
using model::LifecycleStatus;
using json = nlohmann::json;

// ════════════════════════════════════════════════════════════
// In-process stand-in for the dispatch backend
// ════════════════════════════════════════════════════════════

class DispatchOffice : public Transport {
public:
    Result<Entity> fetch_snapshot(const std::string& entity_id) override {
        std::lock_guard lock(mutex_);
        auto it = records_.find(entity_id);
        if (it == records_.end()) {
            return Err<Entity>(ErrorCode::NotFound, "No record " + entity_id);
        }
        return Ok(it->second);
    }

    Result<std::vector<PushAck>> push_entries(const std::vector<model::ChangeLogEntry>& entries) override {
        std::lock_guard lock(mutex_);
        std::vector<PushAck> acks;
        for (const auto& entry : entries) {
            PushAck ack;
            ack.entry_id = entry.entry_id;
            std::string id = entry.entity_id;
            if (entry.entity_id.rfind(model::kTemporaryIdPrefix, 0) == 0) {
                auto assigned = assigned_ids_.find(entry.entity_id);
                if (assigned == assigned_ids_.end()) {
                    assigned = assigned_ids_.emplace(entry.entity_id, "cust-" + std::to_string(++next_id_)).first;
                }
                id = assigned->second;
                ack.server_entity_id = id;
            }

            auto& record = records_[id];
            record.id = id;
            record.type = entry.entity_type;
            switch (entry.kind) {
                case model::MutationKind::FieldUpdate:
                    record.fields[entry.target] = entry.payload;
                    break;
                case model::MutationKind::StatusTransition:
                    if (auto status = model::status_from_string(entry.payload)) {
                        record.status = *status;
                    }
                    break;
                case model::MutationKind::CollectionAppend:
                    record.collections[entry.target].emplace_back(entry.payload, entry.device_id, entry.created_at);
                    break;
            }
            acks.push_back(std::move(ack));
        }
        return Ok(std::move(acks));
    }

    // Dispatcher-side edit
    void publish(const Entity& entity) {
        std::lock_guard lock(mutex_);
        records_[entity.id] = entity;
    }

private:
    std::mutex mutex_;
    std::map<std::string, Entity> records_;
    std::map<std::string, std::string> assigned_ids_;
    int next_id_ = 100;
};

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

template<typename T>
bool report(const Result<T>& result, const std::string& what) {
    if (result.is_error()) {
        spdlog::error("{} failed: {}", what, describe(result.error()));
        return false;
    }
    return true;
}

void print_summary(const SyncCoordinator& coordinator) {
    const auto summary = coordinator.summary();
    json out{
        {"online", summary.is_online},
        {"pending_operations", summary.pending_operations},
        {"conflicts", summary.conflicts},
        {"degraded", summary.degraded}
    };
    std::cout << out.dump(2) << std::endl;
}

int main(int argc, char** argv) {
    EngineConfig config;
    config.device_id = "tablet-07";
    config.initial_backoff = std::chrono::milliseconds(50);
    if (argc > 1) {
        auto loaded = load_config(argv[1]);
        if (!report(loaded, "Loading configuration")) {
            return 1;
        }
        config = loaded.value();
    }
    if (!report(configure_logging(config), "Configuring logging")) {
        return 1;
    }

    const std::filesystem::path state_dir = argc > 2 ? argv[2] : std::filesystem::path("field_agent_state");

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    DispatchOffice office;
    ChangeLog change_log(config.change_log_capacity, config.retention_window);
    EntitySnapshotStore store;
    SyncCoordinator coordinator(config, office, change_log, store, bus);
    JsonFileStore persistence(state_dir);

    if (!report(persistence.load_all(change_log, store, coordinator), "Restoring device state")) {
        return 1;
    }

    // Morning download while still in the depot
    Entity job;
    job.id = "job-4711";
    job.status = LifecycleStatus::Assigned;
    job.fields["address"] = "Av. Corrientes 1847";
    job.fields["service_type"] = "hvac_repair";
    job.fields["total"] = "45000";
    office.publish(job);
    if (!store.contains(job.id)) {
        report(store.commit(job, job), "Caching " + job.id);
    }

    // Driving out of coverage
    coordinator.set_online(false);
    report(coordinator.record_status_transition(job.id, LifecycleStatus::EnRoute), "En route");
    report(coordinator.record_status_transition(job.id, LifecycleStatus::InProgress), "Start work");
    report(coordinator.record_collection_append(job.id, "photos", "photo://before-1"), "Photo");
    report(coordinator.record_field_update(job.id, "completion_notes", "Replaced capacitor, tested"), "Notes");
    report(coordinator.record_status_transition(job.id, LifecycleStatus::Completed), "Complete");

    Entity customer;
    customer.type = model::EntityType::Customer;
    customer.fields["name"] = "Kiosco La Esquina";
    customer.fields["phone"] = "+54 11 4000 1234";
    auto customer_id = coordinator.create_entity(customer);
    report(customer_id, "New customer");

    // Meanwhile the dispatcher cancels the job
    Entity cancelled = job;
    cancelled.status = LifecycleStatus::Cancelled;
    office.publish(cancelled);

    print_summary(coordinator);

    // Back in coverage
    coordinator.set_online(true);
    for (const auto& outcome : coordinator.trigger_sync_all()) {
        report(outcome.result, "Pass for " + outcome.entity_id);
    }

    for (const auto& conflict : coordinator.pending_conflicts()) {
        std::cout << "Needs a decision: " << model::conflict_to_json(conflict).dump(2) << std::endl;
        // The technician insists the work was done
        report(coordinator.resolve_conflict(conflict.conflict_id, model::ResolutionChoice::KeepLocal),
               "Resolving " + conflict.conflict_id);
    }
    report(coordinator.trigger_sync(job.id), "Pushing resolution");

    auto final_job = store.local(job.id);
    if (final_job.is_ok()) {
        std::cout << model::entity_to_json(final_job.value()).dump(2) << std::endl;
    }
    print_summary(coordinator);
    metrics.print_stats();

    return report(persistence.save_all(change_log, store, coordinator), "Saving device state") ? 0 : 1;
}
