#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".tandem";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_repo_config_path(const fs::path& repo_dir) {
    return repo_dir / REPO_CONFIG_FILE;
}

bool repo_config_exists(const fs::path& repo_dir) {
    return fs::exists(get_repo_config_path(repo_dir));
}

std::optional<MediaStrategy> parse_media_strategy(const std::string& name) {
    if (name == "auto-download") return MediaStrategy::AutoDownload;
    if (name == "stream-only") return MediaStrategy::StreamOnly;
    if (name == "stream-and-save") return MediaStrategy::StreamAndSave;
    return std::nullopt;
}

std::string media_strategy_name(MediaStrategy strategy) {
    switch (strategy) {
        case MediaStrategy::AutoDownload:  return "auto-download";
        case MediaStrategy::StreamOnly:    return "stream-only";
        case MediaStrategy::StreamAndSave: return "stream-and-save";
    }
    return "auto-download";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# tandem configuration
# Repository-level .tandem.yaml files override these keys.

remote: "origin"

lfs:
  pointer_prefix: ".project/attachments/pointers"
  payload_prefix: ".project/attachments/files"
  media_strategy: "auto-download"    # auto-download | stream-only | stream-and-save
  # endpoint: "https://example.com/org/repo.git/info/lfs"

lock:
  heartbeat_timeout_ms: 30000
  progress_timeout_ms: 120000
  heartbeat_interval_ms: 5000

sync:
  connectivity_timeout_ms: 3000
  push_retries: 3

# author:
#   name: ""
#   email: ""
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<void> Config::overlay(const fs::path& source) {
    try {
        YAML::Node root = YAML::LoadFile(source.string());
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) {
            return Result<void>::Err(source.string() + ": top level must be a mapping");
        }

        if (root["remote"]) sync_.remote = root["remote"].as<std::string>();

        if (auto lfs = root["lfs"]) {
            if (lfs["pointer_prefix"]) lfs_.pointer_prefix = lfs["pointer_prefix"].as<std::string>();
            if (lfs["payload_prefix"]) lfs_.payload_prefix = lfs["payload_prefix"].as<std::string>();
            if (lfs["endpoint"]) lfs_.endpoint = lfs["endpoint"].as<std::string>();
            if (lfs["media_strategy"]) {
                auto name = lfs["media_strategy"].as<std::string>();
                auto strategy = parse_media_strategy(name);
                if (!strategy) {
                    return Result<void>::Err(source.string() + ": unknown lfs.media_strategy '" + name + "'");
                }
                lfs_.media_strategy = *strategy;
            }
        }

        if (auto lock = root["lock"]) {
            lock_.heartbeat_timeout_ms = lock["heartbeat_timeout_ms"].as<int64_t>(lock_.heartbeat_timeout_ms);
            lock_.progress_timeout_ms = lock["progress_timeout_ms"].as<int64_t>(lock_.progress_timeout_ms);
            lock_.heartbeat_interval_ms = lock["heartbeat_interval_ms"].as<int>(lock_.heartbeat_interval_ms);
        }

        if (auto sync = root["sync"]) {
            sync_.connectivity_timeout_ms = sync["connectivity_timeout_ms"].as<int>(sync_.connectivity_timeout_ms);
            sync_.push_retries = sync["push_retries"].as<int>(sync_.push_retries);
        }

        if (auto author = root["author"]) {
            AuthorIdentity id = sync_.author.value_or(AuthorIdentity{});
            id.name = author["name"].as<std::string>(id.name);
            id.email = author["email"].as<std::string>(id.email);
            if (!id.name.empty() && !id.email.empty()) sync_.author = id;
        }

        if (lock_.heartbeat_interval_ms <= 0 || lock_.heartbeat_timeout_ms <= 0 ||
            lock_.progress_timeout_ms <= 0) {
            return Result<void>::Err(source.string() + ": lock timeouts must be positive");
        }
        if (sync_.push_retries < 1) sync_.push_retries = 1;

        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to parse " + source.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }
    auto r = config.overlay(path);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& repo_dir, const fs::path& global_path) {
    auto global_result = load_global(global_path);
    if (!global_result.is_ok()) {
        return global_result;
    }

    Config config = global_result.value;
    config.repo_dir_ = repo_dir;

    if (repo_config_exists(repo_dir)) {
        auto r = config.overlay(get_repo_config_path(repo_dir));
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    return Result<Config>::Ok(config);
}
