#pragma once

/**
 * @file scheduler.hpp
 * @brief Decides WHEN passes run: debounced triggers, reconnects, periodic sweeps
 *
 * TRIGGERS:
 * - request_sync(): local edit happened; waits for the debounce window so a
 *   burst of edits becomes one pass
 * - on_connectivity_changed(true): runs a pass right away
 * - start_periodic(): background sweep while the app is open
 *
 * All timer work happens on the io_context the scheduler was given; run it on
 * one thread. Sweeps are handed to a single sweep worker so a slow pass (with
 * transport backoff) never holds up the timers. A sweep requested while one
 * is running is folded into one more sweep after it. Each sweep goes through
 * SyncCoordinator::trigger_sync_all(), which fans out to its own worker pool.
 */

#include "orc/sync/coordinator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace orc::sync {

class SyncScheduler {
public:
    SyncScheduler(boost::asio::io_context& io, SyncCoordinator& coordinator, std::chrono::milliseconds debounce);

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /// Restart the debounce window; one sweep runs when it elapses
    void request_sync();

    /// Forward connectivity to the coordinator; regaining it runs a sweep immediately
    void on_connectivity_changed(bool online);

    void start_periodic(std::chrono::milliseconds interval);

    /// Cancel pending timers and wait for a running sweep; later requests are ignored
    void stop();

    [[nodiscard]] std::uint64_t passes_run() const noexcept { return passes_run_.load(); }

private:
    /// Hand a sweep to the sweep worker (io_context thread)
    void schedule_sweep(const char* reason);
    void run_sweep(const char* reason);
    void arm_periodic();

    boost::asio::io_context& io_;
    SyncCoordinator& coordinator_;
    std::chrono::milliseconds debounce_;
    std::chrono::milliseconds periodic_interval_{0};

    boost::asio::steady_timer debounce_timer_;
    boost::asio::steady_timer periodic_timer_;

    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> passes_run_{0};

    std::mutex sweep_mutex_;
    bool sweeping_ = false;
    bool rerun_ = false;

    // Last member: destroyed (and joined) before the state its sweeps touch
    boost::asio::thread_pool sweep_pool_{1};
};

} // namespace orc::sync
