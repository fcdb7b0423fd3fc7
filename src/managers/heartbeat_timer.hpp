#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

class SyncLockManager;

// Background liveness heartbeats for a held sync lock. Runs while a network
// phase is in flight; only the heartbeat timestamp is refreshed, progress is
// reported separately by the transport callbacks.
class HeartbeatTimer {
public:
    HeartbeatTimer(SyncLockManager& lock, int interval_ms);
    ~HeartbeatTimer();

    HeartbeatTimer(const HeartbeatTimer&) = delete;
    HeartbeatTimer& operator=(const HeartbeatTimer&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    int beats() const { return beats_; }

private:
    void timer_loop();

    SyncLockManager& lock_;
    int interval_ms_;
    std::atomic<bool> running_{false};
    std::atomic<int> beats_{0};
    std::thread thread_;

    std::mutex wait_mutex_;
    std::condition_variable wake_;
};
