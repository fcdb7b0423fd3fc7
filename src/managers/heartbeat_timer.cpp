#include "heartbeat_timer.hpp"
#include "sync_lock_manager.hpp"
#include <core/log.hpp>
#include <chrono>

// ── Construction / Destruction ──────────────────────────────

HeartbeatTimer::HeartbeatTimer(SyncLockManager& lock, int interval_ms)
    : lock_(lock), interval_ms_(interval_ms > 0 ? interval_ms : 1000) {}

HeartbeatTimer::~HeartbeatTimer() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void HeartbeatTimer::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&HeartbeatTimer::timer_loop, this);
    tandem_log(fmt::format("heartbeat: started, every {}ms", interval_ms_));
}

void HeartbeatTimer::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    tandem_log(fmt::format("heartbeat: stopped after {} beats", beats_.load()));
}

// ── Timer loop ──────────────────────────────────────────────

void HeartbeatTimer::timer_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                           [this] { return !running_; });
            if (!running_) return;
        }
        lock_.update_heartbeat();
        ++beats_;
    }
}
