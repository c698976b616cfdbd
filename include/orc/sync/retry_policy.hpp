#pragma once

#include "orc/core/config.hpp"
#include "orc/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace orc::sync {

/**
 * @brief Bounded exponential backoff for transport calls
 *
 * Only ErrorCode::TransportError is retried. Any other error is returned on
 * the first attempt. After max_attempts failures the last TransportError is
 * returned and the caller decides how to surface it.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using CancelCheck = std::function<bool()>;

    RetryPolicy(std::size_t max_attempts,
                std::chrono::milliseconds initial_backoff,
                std::chrono::milliseconds max_backoff,
                double multiplier);

    static RetryPolicy from_config(const EngineConfig& config);

    /// Delay before retry number `retry` (1 = first retry), capped at max_backoff
    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t retry) const;

    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }

    /**
     * @brief Run op until it succeeds, fails permanently or attempts run out
     *
     * on_attempt is called before every attempt. A cancellation observed
     * before an attempt or after a backoff ends the loop with ErrorCode::Cancelled.
     */
    template<typename T>
    Result<T> execute(const std::function<Result<T>()>& op,
                      const Sleeper& sleep,
                      const CancelCheck& cancelled,
                      const std::function<void(std::size_t)>& on_attempt = {}) const {
        for (std::size_t attempt = 1;; ++attempt) {
            if (cancelled && cancelled()) {
                return Err<T>(ErrorCode::Cancelled, "Cancelled before attempt " + std::to_string(attempt));
            }
            if (on_attempt) {
                on_attempt(attempt);
            }

            auto result = op();
            if (result.is_ok() || result.error().code != ErrorCode::TransportError) {
                return result;
            }
            if (attempt >= max_attempts_) {
                return Err<T>(ErrorCode::TransportError,
                              result.error().message + " (after " + std::to_string(attempt) + " attempts)");
            }
            if (sleep) {
                sleep(delay_for(attempt));
            }
        }
    }

private:
    std::size_t max_attempts_;
    std::chrono::milliseconds initial_backoff_;
    std::chrono::milliseconds max_backoff_;
    double multiplier_;
};

} // namespace orc::sync
