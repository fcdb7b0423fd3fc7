#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include <core/nonfatal.hpp>
#include "pointer.hpp"
#include "lfs_client.hpp"

namespace fs = std::filesystem;

struct LfsFailure {
    std::string path;       // pointer path, repo-relative
    std::string oid;
    std::string message;
};

// Outcome of one reconcile pass. Paths are repo-relative pointer paths.
struct LfsReport {
    std::vector<std::string> downloaded;
    std::vector<std::string> uploaded;
    std::vector<std::string> regenerated;         // pointers rebuilt from their payload
    std::vector<std::string> skipped;             // missing payloads left for on-demand fetch
    std::vector<LfsFailure> failed;
    std::vector<std::string> rewritten_pointers;  // pointer files changed on disk (need a commit)

    bool empty() const {
        return downloaded.empty() && uploaded.empty() && regenerated.empty() &&
               skipped.empty() && failed.empty();
    }
};

// A pointer file whose payload is absent or does not match it
struct MissingPayload {
    std::string pointer_path;
    LfsPointer pointer;
};

// A payload file whose bytes are not what its pointer (if any) describes
struct PendingUpload {
    std::string pointer_path;
    fs::path payload_file;
    LfsPointer pointer;       // describes the payload as it is now
};

struct ReconcileOptions {
    // Pointer paths that arrived from the remote in this sync. For these the
    // pointer is authoritative and the local payload is replaced, never uploaded.
    std::set<std::string> incoming_pointers;
};

struct LfsStatus {
    std::vector<std::string> tracked_patterns;
    size_t pointer_files = 0;
    uint64_t total_size = 0;            // sum of pointer sizes
    size_t missing_payloads = 0;
    size_t pending_uploads = 0;
};

// Keeps the pointer tree (committed) and the payload tree (ignored, local)
// in step. Both trees mirror each other below their prefixes:
//   <pointer_prefix>/a/b.png  <->  <payload_prefix>/a/b.png
class LfsReconciler {
public:
    LfsReconciler(const fs::path& repo_dir, const LfsSettings& settings,
                  LfsClient& client, NonFatalSink& sink);

    std::vector<MissingPayload> scan_missing_payloads(const std::set<std::string>& strict_paths = {}) const;
    std::vector<PendingUpload> scan_pending_uploads(const std::set<std::string>& exclude = {}) const;

    // Rebuild empty or corrupt pointers whose payload exists. No network.
    std::vector<std::string> recover_pointers();

    // Recover, download (per media strategy), upload. Auth failures throw
    // LfsError; every other per-object failure lands in the report.
    LfsReport reconcile(const ReconcileOptions& options = {});

    // Download one payload on demand. Returns where the bytes are: the
    // payload tree, or the temp cache under stream-only.
    Result<fs::path> fetch_payload(const std::string& pointer_path);

    LfsStatus lfs_status() const;

    // Keep the payload tree out of commits. Returns true if .gitignore changed.
    Result<bool> ensure_payloads_ignored();

    fs::path payload_path_for(const std::string& pointer_path) const;
    std::string pointer_path_for(const fs::path& payload_file) const;
    bool is_pointer_path(const std::string& path) const;

    // Where stream-only downloads are kept
    fs::path cache_dir() const;

private:
    fs::path repo_dir_;
    LfsSettings settings_;
    LfsClient& client_;
    NonFatalSink& sink_;

    fs::path pointer_root() const { return repo_dir_ / settings_.pointer_prefix; }
    fs::path payload_root() const { return repo_dir_ / settings_.payload_prefix; }

    std::vector<std::string> list_pointer_files() const;
    void download_all(const std::vector<MissingPayload>& missing, LfsReport& report);
    void upload_all(const std::vector<PendingUpload>& pending, LfsReport& report);
};
