#include "lock_store.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>

LockStore::LockStore(fs::path lock_path) : lock_path_(std::move(lock_path)) {}

fs::path LockStore::default_path(const fs::path& repo_dir) {
    return repo_dir / ".git" / SYNC_LOCK_FILE;
}

// Accept both the snake_case keys written here and the camelCase keys other
// writers of this record use.
static YAML::Node field(const YAML::Node& root, const char* key, const char* alt) {
    if (root[key]) return root[key];
    if (alt && root[alt]) return root[alt];
    return YAML::Node();
}

std::optional<SyncLockRecord> LockStore::parse(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) return std::nullopt;
        if (!root["timestamp"]) return std::nullopt;

        SyncLockRecord r;
        r.pid = root["pid"].as<int>(0);
        r.host = root["host"].as<std::string>("");
        r.instance = field(root, "instance", "instanceId").as<std::string>("");
        r.timestamp = root["timestamp"].as<int64_t>(0);
        r.acquired_at = field(root, "acquired_at", "acquiredAt").as<int64_t>(r.timestamp);
        r.last_progress = field(root, "last_progress", "lastProgress").as<int64_t>(0);
        r.phase_changed_at = field(root, "phase_changed_at", "phaseChangedAt").as<int64_t>(0);

        auto phase = parse_phase(root["phase"].as<std::string>("idle"));
        r.phase = phase.value_or(SyncPhase::Idle);

        if (auto p = root["progress"]; p && p.IsMap()) {
            LockProgress progress;
            progress.current = p["current"].as<int64_t>(0);
            progress.total = p["total"].as<int64_t>(0);
            progress.description = p["description"].as<std::string>("");
            r.progress = progress;
        }
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string LockStore::serialize(const SyncLockRecord& r) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "pid" << YAML::Value << r.pid;
    out << YAML::Key << "host" << YAML::Value << r.host;
    if (!r.instance.empty()) {
        out << YAML::Key << "instance" << YAML::Value << r.instance;
    }
    out << YAML::Key << "acquired_at" << YAML::Value << r.acquired_at;
    out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
    out << YAML::Key << "last_progress" << YAML::Value << r.last_progress;
    out << YAML::Key << "phase" << YAML::Value << phase_name(r.phase);
    out << YAML::Key << "phase_changed_at" << YAML::Value << r.phase_changed_at;
    if (r.progress) {
        out << YAML::Key << "progress" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "current" << YAML::Value << r.progress->current;
        out << YAML::Key << "total" << YAML::Value << r.progress->total;
        out << YAML::Key << "description" << YAML::Value << r.progress->description;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::optional<SyncLockRecord> LockStore::load() const {
    return load_from(lock_path_);
}

std::optional<SyncLockRecord> LockStore::load_from(const fs::path& file) {
    auto text = platform::read_file(file);
    if (!text) return std::nullopt;

    if (auto record = parse(*text)) return record;

    // Torn or foreign record: age it by the file's modification time
    std::error_code ec;
    auto mtime = fs::last_write_time(file, ec);
    if (ec) {
        // Vanished between read and stat
        if (!fs::exists(file)) return std::nullopt;
        return SyncLockRecord{};
    }
    auto sys_time = std::chrono::system_clock::now() +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            mtime - fs::file_time_type::clock::now());

    SyncLockRecord r;
    r.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        sys_time.time_since_epoch()).count();
    r.acquired_at = r.timestamp;
    return r;
}

platform::CreateStatus LockStore::create(const SyncLockRecord& record, std::string* error) {
    return platform::create_exclusive(lock_path_, serialize(record), error);
}

Result<void> LockStore::save(const SyncLockRecord& record,
                             const std::function<bool(const SyncLockRecord&)>& still_ours) {
    fs::path tmp = platform::private_sibling(lock_path_, "tmp");

    auto w = platform::write_file(tmp, serialize(record));
    if (w.is_ok() && still_ours) {
        auto current = load();
        if (!current || !still_ours(*current)) {
            w = Result<void>::Err("lock record was removed or replaced by another process");
        }
    }
    if (w.is_ok()) {
        auto r = platform::replace_file(tmp, lock_path_);
        if (r.is_ok()) return r;
        w = r;
    }

    std::error_code ec;
    fs::remove(tmp, ec);
    return w;
}

Result<void> LockStore::remove() {
    return platform::remove_file(lock_path_);
}

platform::TakeOverStatus LockStore::remove_if(const std::function<bool(const SyncLockRecord&)>& stale,
                                              std::string* error) {
    return platform::remove_if_stale(lock_path_, [&](const fs::path& claimed) {
        auto record = load_from(claimed);
        return record && stale(*record);
    }, error);
}

bool LockStore::exists() const {
    std::error_code ec;
    return fs::exists(lock_path_, ec);
}
