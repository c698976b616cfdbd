#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration (loaded from JSON, every key optional)
 *
 * EXAMPLE FILE:
 * {
 *   "device_id": "tablet-07",
 *   "change_log_capacity": 50,
 *   "max_attempts": 5,
 *   "initial_backoff_ms": 500,
 *   "demotion_policy": "forward_progress",
 *   "log_level": "info"
 * }
 */

#include "orc/core/result.hpp"
#include "orc/sync/status_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace orc {

struct EngineConfig {
    std::string device_id = "device";

    // Change log
    std::size_t change_log_capacity = 50;
    std::chrono::milliseconds retention_window{24 * 60 * 60 * 1000};

    // Transport retry
    std::size_t max_attempts = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30000};
    double backoff_multiplier = 2.0;

    // Conflicts
    std::chrono::milliseconds stale_conflict_threshold{72LL * 60 * 60 * 1000};
    std::size_t support_conflict_threshold = 10;
    sync::DemotionPolicy demotion_policy = sync::DemotionPolicy::ForwardProgress;

    // Scheduling
    std::chrono::milliseconds sync_debounce{5000};
    std::size_t worker_threads = 4;

    std::string log_level = "info";
};

Result<EngineConfig> config_from_json(const nlohmann::json& json);
Result<EngineConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const EngineConfig& config);

} // namespace orc
