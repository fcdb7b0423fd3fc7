#include "sync_lock_manager.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── Construction / Destruction ──────────────────────────────

SyncLockManager::SyncLockManager(const fs::path& repo_dir, LockSettings settings,
                                 NonFatalSink& sink, std::string instance)
    : store_(LockStore::default_path(repo_dir)),
      settings_(settings),
      sink_(sink),
      instance_(std::move(instance)),
      host_(platform::host_name()),
      pid_(platform::current_pid()),
      clock_(now_ms) {}

SyncLockManager::~SyncLockManager() {
    release();
}

// ── Ownership ───────────────────────────────────────────────

bool SyncLockManager::owner_gone(const SyncLockRecord& record) const {
    if (record.pid <= 0 || record.host.empty()) return false;
    if (record.host != host_) return false;
    return !platform::process_exists(record.pid);
}

bool SyncLockManager::owns(const SyncLockRecord& record) const {
    if (!held_) return false;
    return record.pid == held_->pid && record.host == held_->host &&
           record.acquired_at == held_->acquired_at;
}

LockState SyncLockManager::state_of(const SyncLockRecord& record) const {
    return classify(record, now(), settings_, owner_gone(record));
}

bool SyncLockManager::take_over(const std::function<bool(LockState)>& removable, const char* where) {
    std::string error;
    auto status = store_.remove_if([&](const SyncLockRecord& claimed) {
        return removable(state_of(claimed));
    }, &error);

    switch (status) {
        case platform::TakeOverStatus::Removed:
            return true;
        case platform::TakeOverStatus::Missing:
        case platform::TakeOverStatus::NotStale:
            return false;
        case platform::TakeOverStatus::Displaced:
            sink_.report(where, "a live lock record was displaced by a concurrent acquire");
            return false;
        case platform::TakeOverStatus::Failed:
            sink_.report(where, error);
            return false;
    }
    return false;
}

bool SyncLockManager::held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.has_value();
}

// ── Acquire / Release ───────────────────────────────────────

bool SyncLockManager::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    SyncLockRecord record;
    record.pid = pid_;
    record.host = host_;
    record.instance = instance_;

    for (int attempt = 0; attempt < 2; ++attempt) {
        int64_t t = now();
        record.acquired_at = t;
        record.timestamp = t;
        record.last_progress = t;
        record.phase = SyncPhase::Idle;
        record.phase_changed_at = t;

        std::string error;
        auto created = store_.create(record, &error);
        if (created == platform::CreateStatus::Created) {
            held_ = record;
            tandem_log(fmt::format("sync_lock: acquired {}", store_.path().string()));
            return true;
        }
        if (created == platform::CreateStatus::Failed) {
            sink_.report("sync_lock.acquire", "cannot create " + store_.path().string() + ": " + error);
            return false;
        }

        // Someone holds it. Only a dead holder is displaced, and only once.
        if (attempt > 0) break;

        auto existing = store_.load();
        if (!existing) continue;    // released between our create and load

        auto state = state_of(*existing);
        if (state != LockState::Dead) {
            tandem_log(fmt::format("sync_lock: busy ({}, pid {} on {}, phase {})",
                                   lock_state_name(state), existing->pid,
                                   existing->host, phase_name(existing->phase)));
            return false;
        }

        // Another acquirer may have replaced the dead record since our load
        if (!take_over([](LockState s) { return s == LockState::Dead; }, "sync_lock.acquire")) {
            if (store_.exists()) {
                tandem_log("sync_lock: dead lock was taken over by another process");
                return false;
            }
            continue;
        }
        tandem_log(fmt::format("sync_lock: recovered stale lock of pid {} on {} (silent for {})",
                               existing->pid, existing->host,
                               format_age(now() - existing->timestamp)));
    }
    return false;
}

void SyncLockManager::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_) return;

    auto current = store_.load();
    if (current && owns(*current)) {
        auto r = store_.remove();
        if (r.is_err()) {
            sink_.report("sync_lock.release", r.error);
        } else {
            tandem_log("sync_lock: released");
        }
    } else {
        tandem_log("sync_lock: release skipped, record no longer ours");
    }
    held_.reset();
}

// ── Heartbeats ──────────────────────────────────────────────

void SyncLockManager::update_heartbeat(const HeartbeatUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_) {
        sink_.report("sync_lock.heartbeat", "heartbeat without holding the lock");
        return;
    }

    auto current = store_.load();
    if (!current || !owns(*current)) {
        sink_.report("sync_lock.heartbeat", "lock record was removed or replaced by another process");
        held_.reset();
        return;
    }

    SyncLockRecord next = *held_;
    int64_t t = now();
    next.timestamp = std::max(next.timestamp, t);
    if (update.progress_made || update.progress) {
        next.last_progress = std::max(next.last_progress, t);
    }
    if (update.progress) {
        next.progress = update.progress;
    }
    if (update.phase && *update.phase != next.phase) {
        next.phase = *update.phase;
        next.phase_changed_at = std::max(next.phase_changed_at, t);
        next.last_progress = std::max(next.last_progress, t);
        next.progress.reset();
        if (update.progress) next.progress = update.progress;
    }

    bool replaced = false;
    auto r = store_.save(next, [&](const SyncLockRecord& on_disk) {
        replaced = !owns(on_disk);
        return !replaced;
    });
    if (r.is_err()) {
        sink_.report("sync_lock.heartbeat", r.error);
        if (replaced) held_.reset();
        return;
    }
    held_ = next;
}

// ── Diagnosis ───────────────────────────────────────────────

LockStatus SyncLockManager::check_status() const {
    auto record = store_.load();
    bool gone = record ? owner_gone(*record) : false;
    return describe(record, now(), settings_, gone);
}

bool SyncLockManager::cleanup_stale() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto record = store_.load();
    if (!record) return false;
    if (state_of(*record) != LockState::Dead) return false;

    if (!take_over([](LockState s) { return s == LockState::Dead; }, "sync_lock.cleanup")) {
        return false;
    }
    tandem_log(fmt::format("sync_lock: removed stale lock of pid {} on {}",
                           record->pid, record->host));
    return true;
}

bool SyncLockManager::force_reclaim() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto record = store_.load();
    if (!record) return false;
    auto state = state_of(*record);
    if (state == LockState::Active) return false;

    if (!take_over([](LockState s) { return s != LockState::Active; }, "sync_lock.reclaim")) {
        return false;
    }
    tandem_log(fmt::format("sync_lock: reclaimed {} lock of pid {} (phase {})",
                           lock_state_name(state), record->pid, phase_name(record->phase)));
    return true;
}
