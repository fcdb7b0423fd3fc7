#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <functional>
#include <core/config.hpp>
#include <git/git_backend.hpp>
#include <lfs/lfs_reconciler.hpp>
#include "conflict_detector.hpp"
#include "sync_lock_manager.hpp"

enum class SyncStatus {
    Synced,
    Conflicts,          // merge stopped before pushing, see conflicts
    Offline,            // remote unreachable; local commit kept
    AlreadyRunning,     // manual sync while another holds the lock
    Skipped,            // automatic sync while another holds the lock
    AuthFailed,
    Rejected,           // remote refused the push
    Failed,
};

std::string sync_status_name(SyncStatus status);

enum class SyncTrigger {
    Manual,
    Automatic,
};

struct SyncResult {
    SyncStatus status = SyncStatus::Synced;
    bool had_conflicts = false;
    std::vector<Conflict> conflicts;
    bool offline = false;
    std::optional<std::string> pushed_commit;
    std::string message;
    LfsReport lfs;

    bool ok() const { return status == SyncStatus::Synced; }
};

enum class RemoteBranchState {
    Found,
    NotFound,
    Error,
};

struct RemoteBranchStatus {
    RemoteBranchState state = RemoteBranchState::Error;
    std::optional<std::string> oid;
    std::string message;
};

// Reachability of a remote URL within timeout_ms
using ConnectivityProbe = std::function<bool(const std::string& remote_url, int timeout_ms)>;

// TCP connect to the remote's host and port; local paths are checked on disk.
bool default_connectivity_probe(const std::string& remote_url, int timeout_ms);

// Drives one sync: lock, commit, fetch, merge, reconcile large objects, push.
// The lock is released on every path out of sync_changes / complete_merge.
class SyncManager {
public:
    // `lfs` may be null when the repository carries no large objects.
    SyncManager(GitBackend& git, SyncLockManager& lock, const Config& config,
                LfsReconciler* lfs = nullptr);

    SyncResult sync_changes(const GitCredentials& creds, const AuthorIdentity& author,
                            SyncTrigger trigger = SyncTrigger::Manual,
                            StatusCallback cb = nullptr);

    // Finish a merge that stopped on conflicts. Each resolved file holds its
    // final content in the work tree (a missing file resolves to deletion).
    SyncResult complete_merge(const GitCredentials& creds, const AuthorIdentity& author,
                              const std::vector<std::string>& resolved_files,
                              StatusCallback cb = nullptr);

    // Compact loose objects into a pack while holding the sync lock.
    Result<PackStats> pack_repository(bool silent, StatusCallback cb = nullptr);

    RemoteBranchStatus remote_branch_status(const GitCredentials& creds);

    void set_connectivity_probe(ConnectivityProbe probe) { probe_ = std::move(probe); }
    void set_sleep(std::function<void(int)> sleep) { sleep_ = std::move(sleep); }

private:
    GitBackend& git_;
    SyncLockManager& lock_;
    const Config& config_;
    LfsReconciler* lfs_;
    ConflictDetector detector_;
    ConnectivityProbe probe_;
    std::function<void(int)> sleep_;

    std::string remote() const { return config_.sync().remote; }
    std::string remote_ref(const std::string& branch) const;

    void set_phase(SyncPhase phase);
    bool commit_local_changes(const AuthorIdentity& author, StatusCallback cb);
    bool is_online(StatusCallback cb);
    void fetch(const GitCredentials& creds);
    void fast_forward(const std::string& branch, const std::string& target);
    void apply_changes(const std::vector<MergeChange>& changes);
    std::set<std::string> changed_pointer_paths(const std::optional<std::string>& from,
                                                const std::string& to);
    void reconcile_lfs(const std::set<std::string>& incoming, const AuthorIdentity& author,
                       SyncResult& result, StatusCallback cb);
    void push_with_retry(const std::string& branch, const GitCredentials& creds,
                         SyncResult& result, StatusCallback cb);
};
