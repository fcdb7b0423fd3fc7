#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_repo_config_path(const fs::path& repo_dir);

class Config {
public:
    // Load global config from ~/.tandem/config.yaml (defaults if absent)
    static Result<Config> load_global(const fs::path& path = get_global_config_path());

    // Load both and combine (repository .tandem.yaml overrides global keys)
    static Result<Config> load(const fs::path& repo_dir,
                               const fs::path& global_path = get_global_config_path());

    // Accessors
    const LockSettings& lock() const { return lock_; }
    const LfsSettings& lfs() const { return lfs_; }
    const SyncSettings& sync() const { return sync_; }
    const fs::path& repo_dir() const { return repo_dir_; }

    Config() = default;

private:
    // Apply the keys present in one YAML document on top of the current values.
    Result<void> overlay(const fs::path& source);

    LockSettings lock_;
    LfsSettings lfs_;
    SyncSettings sync_;
    fs::path repo_dir_;
};

bool repo_config_exists(const fs::path& repo_dir);

// "auto-download" | "stream-only" | "stream-and-save"
std::optional<MediaStrategy> parse_media_strategy(const std::string& name);
std::string media_strategy_name(MediaStrategy strategy);

// Create default global config
Result<void> create_default_global_config();
