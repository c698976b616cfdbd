#include "orc/core/config.hpp"

#include <fstream>

using json = nlohmann::json;

namespace orc {
namespace {

std::string policy_name(sync::DemotionPolicy policy) {
    switch (policy) {
        case sync::DemotionPolicy::ForwardProgress: return "forward_progress";
        case sync::DemotionPolicy::DispatcherAuthority: return "dispatcher_authority";
    }
    return "forward_progress";
}

Result<void> validate(const EngineConfig& config) {
    if (config.device_id.empty()) {
        return Err<void>(ErrorCode::ConfigError, "device_id must not be empty");
    }
    if (config.change_log_capacity == 0) {
        return Err<void>(ErrorCode::ConfigError, "change_log_capacity must be positive");
    }
    if (config.max_attempts == 0) {
        return Err<void>(ErrorCode::ConfigError, "max_attempts must be at least 1");
    }
    if (config.backoff_multiplier < 1.0) {
        return Err<void>(ErrorCode::ConfigError, "backoff_multiplier must be >= 1.0");
    }
    if (config.initial_backoff > config.max_backoff) {
        return Err<void>(ErrorCode::ConfigError, "initial_backoff_ms exceeds max_backoff_ms");
    }
    if (config.worker_threads == 0) {
        return Err<void>(ErrorCode::ConfigError, "worker_threads must be positive");
    }
    return Ok();
}

} // namespace

Result<EngineConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<EngineConfig>(ErrorCode::ConfigError, "Configuration root must be an object");
    }

    EngineConfig config;
    try {
        config.device_id = j.value("device_id", config.device_id);
        config.change_log_capacity = j.value("change_log_capacity", config.change_log_capacity);
        config.retention_window = std::chrono::milliseconds(
            j.value("retention_window_ms", config.retention_window.count()));
        config.max_attempts = j.value("max_attempts", config.max_attempts);
        config.initial_backoff = std::chrono::milliseconds(
            j.value("initial_backoff_ms", config.initial_backoff.count()));
        config.max_backoff = std::chrono::milliseconds(
            j.value("max_backoff_ms", config.max_backoff.count()));
        config.backoff_multiplier = j.value("backoff_multiplier", config.backoff_multiplier);
        config.stale_conflict_threshold = std::chrono::milliseconds(
            j.value("stale_conflict_threshold_ms", config.stale_conflict_threshold.count()));
        config.support_conflict_threshold = j.value("support_conflict_threshold", config.support_conflict_threshold);
        config.sync_debounce = std::chrono::milliseconds(
            j.value("sync_debounce_ms", config.sync_debounce.count()));
        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.log_level = j.value("log_level", config.log_level);

        const auto policy = j.value("demotion_policy", policy_name(config.demotion_policy));
        if (policy == "forward_progress") {
            config.demotion_policy = sync::DemotionPolicy::ForwardProgress;
        } else if (policy == "dispatcher_authority") {
            config.demotion_policy = sync::DemotionPolicy::DispatcherAuthority;
        } else {
            return Err<EngineConfig>(ErrorCode::ConfigError, "Unknown demotion_policy: " + policy);
        }
    } catch (const json::exception& e) {
        return Err<EngineConfig>(ErrorCode::ConfigError, std::string("Invalid configuration value: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<EngineConfig>(valid.error());
    }
    return Ok(config);
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorCode::ConfigError, "Cannot open configuration file: " + path.string());
    }

    json parsed = json::parse(input, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<EngineConfig>(ErrorCode::ConfigError, "Configuration is not valid JSON: " + path.string());
    }
    return config_from_json(parsed);
}

json config_to_json(const EngineConfig& config) {
    return json{
        {"device_id", config.device_id},
        {"change_log_capacity", config.change_log_capacity},
        {"retention_window_ms", config.retention_window.count()},
        {"max_attempts", config.max_attempts},
        {"initial_backoff_ms", config.initial_backoff.count()},
        {"max_backoff_ms", config.max_backoff.count()},
        {"backoff_multiplier", config.backoff_multiplier},
        {"stale_conflict_threshold_ms", config.stale_conflict_threshold.count()},
        {"support_conflict_threshold", config.support_conflict_threshold},
        {"demotion_policy", policy_name(config.demotion_policy)},
        {"sync_debounce_ms", config.sync_debounce.count()},
        {"worker_threads", config.worker_threads},
        {"log_level", config.log_level}
    };
}

} // namespace orc
