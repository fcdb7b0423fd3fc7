#pragma once

#include <string>
#include <optional>
#include <functional>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/nonfatal.hpp>
#include "lock_store.hpp"
#include "sync_lock.hpp"

namespace fs = std::filesystem;

// What a heartbeat changes in the held record. The heartbeat timestamp is
// always refreshed.
struct HeartbeatUpdate {
    std::optional<SyncPhase> phase;
    std::optional<LockProgress> progress;
    bool progress_made = false;     // refresh last_progress
};

// Cross-process sync lock for one repository. One instance per repository
// path, passed explicitly to whoever needs it.
class SyncLockManager {
public:
    using Clock = std::function<int64_t()>;

    SyncLockManager(const fs::path& repo_dir, LockSettings settings, NonFatalSink& sink,
                    std::string instance = "");
    ~SyncLockManager();

    SyncLockManager(const SyncLockManager&) = delete;
    SyncLockManager& operator=(const SyncLockManager&) = delete;

    // Exclusive create of the lock record. A dead record is removed and the
    // create retried once; an active or stuck one makes this return false.
    bool acquire();

    // Refresh the held record. Never throws; failures go to the sink.
    void update_heartbeat(const HeartbeatUpdate& update = {});

    LockStatus check_status() const;

    // Delete the record if this instance owns it. Idempotent.
    void release();

    // Remove the record if it is dead. Returns true if something was removed.
    bool cleanup_stale();

    // Explicitly discard a stuck (or dead) record. Active records are kept.
    bool force_reclaim();

    bool held() const;
    const LockSettings& settings() const { return settings_; }
    const fs::path& lock_path() const { return store_.path(); }
    NonFatalSink& sink() { return sink_; }

    // Tests drive time through this
    void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
    int64_t now() const { return clock_(); }
    bool owner_gone(const SyncLockRecord& record) const;
    bool owns(const SyncLockRecord& record) const;
    LockState state_of(const SyncLockRecord& record) const;

    // Remove the record through LockStore::remove_if, judging the claimed
    // copy with `removable`. Reports anything unexpected under `where`.
    bool take_over(const std::function<bool(LockState)>& removable, const char* where);

    LockStore store_;
    LockSettings settings_;
    NonFatalSink& sink_;
    std::string instance_;
    std::string host_;
    int pid_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<SyncLockRecord> held_;
};
