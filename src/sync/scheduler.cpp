#include "orc/sync/scheduler.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

namespace orc::sync {

SyncScheduler::SyncScheduler(boost::asio::io_context& io,
                             SyncCoordinator& coordinator,
                             std::chrono::milliseconds debounce)
    : io_(io),
      coordinator_(coordinator),
      debounce_(debounce),
      debounce_timer_(io),
      periodic_timer_(io) {}

void SyncScheduler::request_sync() {
    if (stopped_.load()) {
        return;
    }
    boost::asio::post(io_, [this]() {
        // Re-arming cancels the wait already in progress
        debounce_timer_.expires_after(debounce_);
        debounce_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || stopped_.load()) {
                return;
            }
            schedule_sweep("debounce");
        });
    });
}

void SyncScheduler::on_connectivity_changed(bool online) {
    const bool was_online = coordinator_.is_online();
    coordinator_.set_online(online);
    if (!online || was_online || stopped_.load()) {
        return;
    }
    boost::asio::post(io_, [this]() {
        debounce_timer_.cancel();
        if (!stopped_.load()) {
            schedule_sweep("reconnect");
        }
    });
}

void SyncScheduler::start_periodic(std::chrono::milliseconds interval) {
    boost::asio::post(io_, [this, interval]() {
        periodic_interval_ = interval;
        arm_periodic();
    });
}

void SyncScheduler::stop() {
    stopped_.store(true);
    boost::asio::post(io_, [this]() {
        debounce_timer_.cancel();
        periodic_timer_.cancel();
    });
    sweep_pool_.join();
}

void SyncScheduler::schedule_sweep(const char* reason) {
    if (stopped_.load()) {
        return;
    }
    {
        std::lock_guard lock(sweep_mutex_);
        if (sweeping_) {
            rerun_ = true;
            return;
        }
        sweeping_ = true;
    }
    boost::asio::post(sweep_pool_, [this, reason]() {
        for (;;) {
            run_sweep(reason);
            std::lock_guard lock(sweep_mutex_);
            if (!rerun_) {
                sweeping_ = false;
                return;
            }
            rerun_ = false;
        }
    });
}

void SyncScheduler::arm_periodic() {
    if (stopped_.load() || periodic_interval_.count() <= 0) {
        return;
    }
    periodic_timer_.expires_after(periodic_interval_);
    periodic_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_.load()) {
            return;
        }
        schedule_sweep("periodic");
        arm_periodic();
    });
}

void SyncScheduler::run_sweep(const char* reason) {
    if (!coordinator_.is_online()) {
        spdlog::debug("Skipping {} sweep while offline", reason);
        return;
    }

    const auto outcomes = coordinator_.trigger_sync_all();
    ++passes_run_;

    std::size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.result.is_error() && outcome.result.error().code != ErrorCode::PassInProgress) {
            ++failed;
        }
    }
    spdlog::debug("{} sweep finished: {} entities, {} without a completed pass", reason, outcomes.size(), failed);
}

} // namespace orc::sync
