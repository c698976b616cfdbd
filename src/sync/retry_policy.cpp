#include "orc/sync/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace orc::sync {

RetryPolicy::RetryPolicy(std::size_t max_attempts,
                         std::chrono::milliseconds initial_backoff,
                         std::chrono::milliseconds max_backoff,
                         double multiplier)
    : max_attempts_(std::max<std::size_t>(max_attempts, 1)),
      initial_backoff_(initial_backoff),
      max_backoff_(max_backoff),
      multiplier_(std::max(multiplier, 1.0)) {}

RetryPolicy RetryPolicy::from_config(const EngineConfig& config) {
    return RetryPolicy(config.max_attempts, config.initial_backoff, config.max_backoff,
                       config.backoff_multiplier);
}

std::chrono::milliseconds RetryPolicy::delay_for(std::size_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }
    const double scaled = static_cast<double>(initial_backoff_.count()) *
                          std::pow(multiplier_, static_cast<double>(retry - 1));
    const double capped = std::min(scaled, static_cast<double>(max_backoff_.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

} // namespace orc::sync
