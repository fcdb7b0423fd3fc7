#include "metadata_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/file_ops.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Removes the metadata lock when the update leaves scope
class LockGuard {
public:
    explicit LockGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~LockGuard() { release_(); }
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;
private:
    std::function<void()> release_;
};

int64_t file_age_ms(const fs::path& path) {
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return 0;
    auto age = fs::file_time_type::clock::now() - mtime;
    return std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
}

Result<json> parse_document(const std::string& text) {
    try {
        return Result<json>::Ok(json::parse(text));
    } catch (const json::parse_error& e) {
        return Result<json>::Err(std::string("Invalid JSON in metadata.json: ") + e.what());
    }
}

} // namespace

MetadataManager::MetadataManager(const fs::path& repo_dir, NonFatalSink& sink,
                                 MetadataOptions options)
    : metadata_path_(repo_dir / METADATA_FILE),
      lock_path_(repo_dir / METADATA_LOCK_FILE),
      backup_path_(platform::private_sibling(repo_dir / METADATA_BACKUP_FILE, "w")),
      temp_path_(platform::private_sibling(repo_dir / METADATA_TEMP_FILE, "w")),
      sink_(sink),
      options_(options) {}

// ── Lock file ───────────────────────────────────────────────

bool MetadataManager::lock_is_stale(const fs::path& lock_file) const {
    auto text = platform::read_file(lock_file);
    if (!text) return false;

    int64_t stamp = 0;
    try {
        auto lock = json::parse(*text);
        stamp = lock.value("timestamp", int64_t{0});
    } catch (const json::exception&) {
        // Torn write or garbage: judge by the file's age
        return file_age_ms(lock_file) > options_.stale_after_ms;
    }
    return now_ms() - stamp > options_.stale_after_ms;
}

MetadataManager::LockOutcome MetadataManager::acquire_lock(std::string& error) {
    auto deadline = now_ms() + options_.lock_wait_ms;

    while (true) {
        json lock = {
            {"owner", TOOL_ID},
            {"pid", platform::current_pid()},
            {"timestamp", now_ms()},
        };
        auto created = platform::create_exclusive(lock_path_, lock.dump(), &error);
        if (created == platform::CreateStatus::Created) return LockOutcome::Acquired;
        if (created == platform::CreateStatus::Failed) return LockOutcome::Failed;

        if (lock_is_stale(lock_path_)) {
            // Judge the copy we actually took off the path, not the one we read
            std::string take_error;
            auto taken = platform::remove_if_stale(lock_path_, [this](const fs::path& claimed) {
                return lock_is_stale(claimed);
            }, &take_error);
            if (taken == platform::TakeOverStatus::Removed) {
                tandem_log("metadata: removed stale lock " + lock_path_.string());
            } else if (taken == platform::TakeOverStatus::Displaced) {
                sink_.report("metadata.lock", "a live metadata lock was displaced by a concurrent writer");
            } else if (taken == platform::TakeOverStatus::Failed) {
                sink_.report("metadata.lock", take_error);
            }
            if (taken != platform::TakeOverStatus::NotStale) continue;
        }

        if (now_ms() >= deadline) return LockOutcome::Busy;
        platform::sleep_ms(METADATA_LOCK_POLL_MS);
    }
}

void MetadataManager::release_lock() {
    auto r = platform::remove_file(lock_path_);
    if (r.is_err()) sink_.report("metadata.unlock", r.error);
}

// ── Read ────────────────────────────────────────────────────

Result<json> MetadataManager::read() const {
    std::error_code ec;
    if (!fs::exists(metadata_path_, ec)) {
        return Result<json>::Ok(json::object());
    }
    auto text = platform::read_file(metadata_path_);
    if (!text) {
        return Result<json>::Err("Failed to read " + metadata_path_.string());
    }
    return parse_document(*text);
}

// ── Atomic write ────────────────────────────────────────────

Result<void> MetadataManager::atomic_write(const json& doc) {
    bool have_backup = false;
    if (auto existing = platform::read_file(metadata_path_)) {
        auto b = platform::write_file(backup_path_, *existing);
        if (b.is_err()) {
            sink_.report("metadata.backup", b.error);
        } else {
            have_backup = true;
        }
    }

    auto fail = [&](const std::string& error) {
        auto t = platform::remove_file(temp_path_);
        if (t.is_err()) sink_.report("metadata.rollback", t.error);

        if (have_backup) {
            auto backup = platform::read_file(backup_path_);
            if (backup) {
                auto w = platform::write_file(metadata_path_, *backup);
                if (w.is_err()) {
                    sink_.report("metadata.rollback", "restore failed: " + w.error);
                } else {
                    tandem_log("metadata: restored from backup");
                }
            }
            auto rb = platform::remove_file(backup_path_);
            if (rb.is_err()) sink_.report("metadata.rollback", rb.error);
        }
        return Result<void>::Err("Atomic write failed: " + error);
    };

    auto w = platform::write_file(temp_path_, doc.dump(4) + "\n");
    if (w.is_err()) return fail(w.error);

    // Re-read what actually landed on disk before publishing it
    auto written = platform::read_file(temp_path_);
    if (!written) return fail("temporary file vanished");
    auto check = parse_document(*written);
    if (check.is_err()) return fail("validation failed for temporary file: " + check.error);

    auto r = platform::replace_file(temp_path_, metadata_path_);
    if (r.is_err()) return fail(r.error);

    if (have_backup) {
        auto rb = platform::remove_file(backup_path_);
        if (rb.is_err()) sink_.report("metadata.backup", rb.error);
    }
    return Result<void>::Ok();
}

// ── Safe update ─────────────────────────────────────────────

Result<json> MetadataManager::safe_update(const MetadataTransform& transform) {
    int attempts = options_.max_retries > 0 ? options_.max_retries : 1;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        std::string error;
        auto outcome = acquire_lock(error);
        if (outcome == LockOutcome::Failed) {
            return Result<json>::Err("Cannot create metadata lock " + lock_path_.string() + ": " + error);
        }
        if (outcome == LockOutcome::Busy) {
            tandem_log(fmt::format("metadata: lock busy (attempt {}/{})", attempt + 1, attempts));
            if (attempt + 1 < attempts) {
                platform::sleep_ms(options_.retry_delay_ms << attempt);
            }
            continue;
        }

        LockGuard guard([this] { release_lock(); });

        auto current = read();
        if (current.is_err()) {
            return Result<json>::Err("Metadata corruption: " + current.error);
        }

        json updated;
        try {
            updated = transform(std::move(current.value));
        } catch (const std::exception& e) {
            return Result<json>::Err(std::string("Metadata update aborted: ") + e.what());
        }

        auto w = atomic_write(updated);
        if (w.is_err()) return Result<json>::Err(w.error);

        return Result<json>::Ok(updated);
    }

    return Result<json>::Err(fmt::format("Failed to acquire metadata lock after {} attempts", attempts));
}

// ── Extension versions ──────────────────────────────────────

Result<void> MetadataManager::update_required_versions(
        const std::map<std::string, std::string>& versions) {
    auto r = safe_update([&versions](json doc) {
        if (!doc.is_object()) {
            throw std::runtime_error("metadata.json is not an object");
        }
        auto& meta = doc["meta"];
        if (!meta.is_object()) meta = json::object();
        auto& required = meta["requiredExtensions"];
        if (!required.is_object()) required = json::object();
        for (const auto& [key, version] : versions) {
            required[key] = version;
        }
        return doc;
    });
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<std::map<std::string, std::string>> MetadataManager::required_versions() const {
    using Versions = std::map<std::string, std::string>;
    auto doc = read();
    if (doc.is_err()) return Result<Versions>::Err(doc.error);

    Versions versions;
    const auto& d = doc.value;
    if (d.is_object() && d.contains("meta") && d["meta"].is_object() &&
        d["meta"].contains("requiredExtensions") &&
        d["meta"]["requiredExtensions"].is_object()) {
        for (const auto& [key, value] : d["meta"]["requiredExtensions"].items()) {
            if (value.is_string()) versions[key] = value.get<std::string>();
        }
    }
    return Result<Versions>::Ok(versions);
}
