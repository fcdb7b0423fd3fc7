#pragma once

#include <string>
#include <map>
#include <functional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <core/nonfatal.hpp>

namespace fs = std::filesystem;

struct MetadataOptions {
    int max_retries = 5;
    int retry_delay_ms = 100;           // doubled per attempt
    int64_t stale_after_ms = 30000;     // a metadata lock older than this is abandoned
    int lock_wait_ms = 2000;            // per attempt
};

// Receives the current document ({} if metadata.json is absent) and returns
// the document to store. May throw to abort the update.
using MetadataTransform = std::function<nlohmann::json(nlohmann::json)>;

// Serialized read-modify-write of <repo>/metadata.json shared by every
// process working on the repository. Writes go through a backup and a
// validated temp file; the lock file is removed on every exit path.
class MetadataManager {
public:
    MetadataManager(const fs::path& repo_dir, NonFatalSink& sink, MetadataOptions options = {});

    Result<nlohmann::json> safe_update(const MetadataTransform& transform);

    // Lock-free read. Absent file reads as {}.
    Result<nlohmann::json> read() const;

    // meta.requiredExtensions helpers
    Result<void> update_required_versions(const std::map<std::string, std::string>& versions);
    Result<std::map<std::string, std::string>> required_versions() const;

    const fs::path& metadata_path() const { return metadata_path_; }
    const fs::path& lock_path() const { return lock_path_; }
    const fs::path& backup_path() const { return backup_path_; }
    const fs::path& temp_path() const { return temp_path_; }

private:
    enum class LockOutcome { Acquired, Busy, Failed };

    LockOutcome acquire_lock(std::string& error);
    void release_lock();
    bool lock_is_stale(const fs::path& lock_file) const;
    Result<void> atomic_write(const nlohmann::json& doc);

    fs::path metadata_path_;
    fs::path lock_path_;
    fs::path backup_path_;
    fs::path temp_path_;
    NonFatalSink& sink_;
    MetadataOptions options_;
};
