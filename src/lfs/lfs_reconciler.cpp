#include "lfs_reconciler.hpp"
#include "gitattributes.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/file_ops.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <sstream>

// Interrupted downloads leave "<name>.download.<pid>" beside the payload
static bool is_partial_download(const fs::path& file) {
    std::string name = file.filename().string();
    auto pos = name.rfind(".download.");
    if (pos == std::string::npos) return false;
    std::string pid = name.substr(pos + 10);
    return !pid.empty() && pid.find_first_not_of("0123456789") == std::string::npos;
}

static std::optional<LfsPointer> pointer_for_file(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) return std::nullopt;
    auto digest = sha256_file_hex(file);
    if (!digest) return std::nullopt;
    return LfsPointer{*digest, static_cast<uint64_t>(size)};
}

LfsReconciler::LfsReconciler(const fs::path& repo_dir, const LfsSettings& settings,
                             LfsClient& client, NonFatalSink& sink)
    : repo_dir_(repo_dir), settings_(settings), client_(client), sink_(sink) {
    while (!settings_.pointer_prefix.empty() && settings_.pointer_prefix.back() == '/') {
        settings_.pointer_prefix.pop_back();
    }
    while (!settings_.payload_prefix.empty() && settings_.payload_prefix.back() == '/') {
        settings_.payload_prefix.pop_back();
    }
}

// ── Paths ───────────────────────────────────────────────────

fs::path LfsReconciler::payload_path_for(const std::string& pointer_path) const {
    auto rel = fs::path(pointer_path).lexically_relative(settings_.pointer_prefix);
    return payload_root() / rel;
}

std::string LfsReconciler::pointer_path_for(const fs::path& payload_file) const {
    auto rel = payload_file.lexically_relative(payload_root());
    return (fs::path(settings_.pointer_prefix) / rel).generic_string();
}

bool LfsReconciler::is_pointer_path(const std::string& path) const {
    return starts_with(path, settings_.pointer_prefix + "/");
}

fs::path LfsReconciler::cache_dir() const {
    return platform::temp_dir() / "tandem-lfs-cache";
}

std::vector<std::string> LfsReconciler::list_pointer_files() const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(pointer_root(), ec)) return out;

    for (auto it = fs::recursive_directory_iterator(pointer_root(), ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            out.push_back(it->path().lexically_relative(repo_dir_).generic_string());
        }
    }
    if (ec) sink_.report("lfs.scan", fmt::format("walking {}: {}", pointer_root().string(), ec.message()));
    std::sort(out.begin(), out.end());
    return out;
}

// ── Scans ───────────────────────────────────────────────────

std::vector<MissingPayload> LfsReconciler::scan_missing_payloads(
        const std::set<std::string>& strict_paths) const {
    std::vector<MissingPayload> missing;
    for (const auto& path : list_pointer_files()) {
        auto text = platform::read_file(repo_dir_ / path);
        if (!text) continue;
        auto pointer = parse_pointer(*text);
        if (!pointer) continue;

        fs::path payload = payload_path_for(path);
        std::error_code ec;
        if (!fs::is_regular_file(payload, ec)) {
            missing.push_back({path, *pointer});
            continue;
        }
        auto size = fs::file_size(payload, ec);
        if (ec || size != pointer->size) {
            missing.push_back({path, *pointer});
            continue;
        }
        if (strict_paths.count(path)) {
            auto digest = sha256_file_hex(payload);
            if (!digest || *digest != pointer->oid) missing.push_back({path, *pointer});
        }
    }
    return missing;
}

std::vector<PendingUpload> LfsReconciler::scan_pending_uploads(
        const std::set<std::string>& exclude) const {
    std::vector<PendingUpload> pending;
    std::error_code ec;
    if (!fs::is_directory(payload_root(), ec)) return pending;

    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(payload_root(), ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && !is_partial_download(it->path())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::string pointer_path = pointer_path_for(file);
        if (exclude.count(pointer_path)) continue;

        auto current = pointer_for_file(file);
        if (!current) {
            sink_.report("lfs.scan", "cannot hash " + file.string());
            continue;
        }

        auto text = platform::read_file(repo_dir_ / pointer_path);
        auto recorded = text ? parse_pointer(*text) : std::nullopt;
        if (recorded && *recorded == *current) continue;

        pending.push_back({pointer_path, file, *current});
    }
    return pending;
}

// ── Recovery ────────────────────────────────────────────────

std::vector<std::string> LfsReconciler::recover_pointers() {
    std::vector<std::string> regenerated;
    for (const auto& path : list_pointer_files()) {
        auto text = platform::read_file(repo_dir_ / path);
        if (text && parse_pointer(*text)) continue;

        fs::path payload = payload_path_for(path);
        std::error_code ec;
        if (!fs::is_regular_file(payload, ec)) {
            sink_.report("lfs.recover", "corrupt pointer without payload: " + path);
            continue;
        }

        auto pointer = pointer_for_file(payload);
        if (!pointer) {
            sink_.report("lfs.recover", "cannot hash payload for " + path);
            continue;
        }
        auto written = platform::write_file(repo_dir_ / path, format_pointer(*pointer));
        if (written.is_err()) {
            sink_.report("lfs.recover", path + ": " + written.error);
            continue;
        }
        tandem_log(fmt::format("lfs: regenerated pointer {} ({})", path, pointer->oid));
        regenerated.push_back(path);
    }
    return regenerated;
}

// ── Transfers ───────────────────────────────────────────────

void LfsReconciler::download_all(const std::vector<MissingPayload>& missing, LfsReport& report) {
    if (missing.empty()) return;

    std::map<std::string, std::vector<const MissingPayload*>> by_oid;
    std::vector<LfsObject> objects;
    for (const auto& m : missing) {
        auto& group = by_oid[m.pointer.oid];
        if (group.empty()) objects.push_back({m.pointer.oid, m.pointer.size});
        group.push_back(&m);
    }

    auto fail_group = [&](const std::string& oid, const std::string& message) {
        for (const auto* m : by_oid[oid]) report.failed.push_back({m->pointer_path, oid, message});
        by_oid.erase(oid);
    };

    std::vector<TransferDescriptor> descriptors;
    try {
        descriptors = client_.negotiate_batch(objects, TransferDirection::Download);
    } catch (const LfsError& e) {
        if (e.kind() == LfsErrorKind::Auth) throw;
        for (const auto& obj : objects) fail_group(obj.oid, e.what());
        return;
    }

    for (const auto& d : descriptors) {
        auto it = by_oid.find(d.object.oid);
        if (it == by_oid.end()) continue;

        if (!d.action) {
            fail_group(d.object.oid, d.error_message.empty()
                ? "server has no copy" : fmt::format("{} ({})", d.error_message, d.error_code));
            continue;
        }

        const auto& group = it->second;
        fs::path first = payload_path_for(group.front()->pointer_path);
        try {
            client_.download(d, first);
        } catch (const LfsError& e) {
            if (e.kind() == LfsErrorKind::Auth) throw;
            fail_group(d.object.oid, e.what());
            continue;
        }
        report.downloaded.push_back(group.front()->pointer_path);

        for (size_t i = 1; i < group.size(); ++i) {
            fs::path dest = payload_path_for(group[i]->pointer_path);
            std::error_code ec;
            fs::create_directories(dest.parent_path(), ec);
            fs::copy_file(first, dest, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                report.failed.push_back({group[i]->pointer_path, d.object.oid, ec.message()});
            } else {
                report.downloaded.push_back(group[i]->pointer_path);
            }
        }
        by_oid.erase(it);
    }

    // Anything the server left out of its response
    std::vector<std::string> leftover;
    for (const auto& [oid, group] : by_oid) leftover.push_back(oid);
    for (const auto& oid : leftover) fail_group(oid, "missing from batch response");
}

void LfsReconciler::upload_all(const std::vector<PendingUpload>& pending, LfsReport& report) {
    if (pending.empty()) return;

    std::map<std::string, std::vector<const PendingUpload*>> by_oid;
    std::vector<LfsObject> objects;
    for (const auto& p : pending) {
        auto& group = by_oid[p.pointer.oid];
        if (group.empty()) objects.push_back({p.pointer.oid, p.pointer.size});
        group.push_back(&p);
    }

    auto fail_group = [&](const std::string& oid, const std::string& message) {
        for (const auto* p : by_oid[oid]) report.failed.push_back({p->pointer_path, oid, message});
        by_oid.erase(oid);
    };

    // The object is on the server: publish it through the pointers
    auto publish_group = [&](const std::string& oid) {
        for (const auto* p : by_oid[oid]) {
            fs::path pointer_file = repo_dir_ / p->pointer_path;
            std::error_code ec;
            fs::create_directories(pointer_file.parent_path(), ec);
            auto written = platform::write_file(pointer_file, format_pointer(p->pointer));
            if (written.is_err()) {
                report.failed.push_back({p->pointer_path, oid, written.error});
                continue;
            }
            report.uploaded.push_back(p->pointer_path);
            report.rewritten_pointers.push_back(p->pointer_path);
        }
    };

    std::vector<TransferDescriptor> descriptors;
    try {
        descriptors = client_.negotiate_batch(objects, TransferDirection::Upload);
    } catch (const LfsError& e) {
        if (e.kind() == LfsErrorKind::Auth) throw;
        for (const auto& obj : objects) fail_group(obj.oid, e.what());
        return;
    }

    for (const auto& d : descriptors) {
        auto it = by_oid.find(d.object.oid);
        if (it == by_oid.end()) continue;

        if (d.error_code != 0) {
            fail_group(d.object.oid, fmt::format("{} ({})", d.error_message, d.error_code));
            continue;
        }

        const auto& group = it->second;
        try {
            client_.upload(d, group.front()->payload_file);
        } catch (const LfsError& e) {
            if (e.kind() == LfsErrorKind::Auth) throw;
            fail_group(d.object.oid, e.what());
            continue;
        }

        publish_group(d.object.oid);
        by_oid.erase(it);
    }

    // An upload the server left out of its response is already stored there
    std::vector<std::string> leftover;
    for (const auto& [oid, group] : by_oid) leftover.push_back(oid);
    for (const auto& oid : leftover) {
        tandem_log(fmt::format("lfs: server already has {}", oid));
        publish_group(oid);
        by_oid.erase(oid);
    }
}

LfsReport LfsReconciler::reconcile(const ReconcileOptions& options) {
    LfsReport report;

    report.regenerated = recover_pointers();
    report.rewritten_pointers = report.regenerated;

    auto missing = scan_missing_payloads(options.incoming_pointers);
    std::vector<MissingPayload> to_download;
    for (const auto& m : missing) {
        std::error_code ec;
        bool present = fs::exists(payload_path_for(m.pointer_path), ec);
        bool incoming = options.incoming_pointers.count(m.pointer_path) > 0;

        // A local payload that differs from a pointer we already had is an
        // edit; the upload pass publishes it
        if (present && !incoming) continue;

        // Stale copies of incoming pointers are always replaced; plain gaps
        // follow the strategy
        if (settings_.media_strategy == MediaStrategy::AutoDownload || present) {
            to_download.push_back(m);
        } else {
            report.skipped.push_back(m.pointer_path);
        }
    }
    download_all(to_download, report);

    upload_all(scan_pending_uploads(options.incoming_pointers), report);

    tandem_log(fmt::format("lfs: reconcile downloaded={} uploaded={} regenerated={} skipped={} failed={}",
                           report.downloaded.size(), report.uploaded.size(),
                           report.regenerated.size(), report.skipped.size(),
                           report.failed.size()));
    for (const auto& f : report.failed) {
        tandem_log(fmt::format("lfs: {} ({}) failed: {}", f.path, f.oid, f.message));
    }
    return report;
}

Result<fs::path> LfsReconciler::fetch_payload(const std::string& pointer_path) {
    auto text = platform::read_file(repo_dir_ / pointer_path);
    if (!text) return Result<fs::path>::Err("No pointer file at " + pointer_path);
    auto pointer = parse_pointer(*text);
    if (!pointer) return Result<fs::path>::Err("Not a valid pointer: " + pointer_path);

    fs::path dest = settings_.media_strategy == MediaStrategy::StreamOnly
        ? cache_dir() / pointer->oid
        : payload_path_for(pointer_path);

    std::error_code ec;
    if (fs::is_regular_file(dest, ec)) {
        auto digest = sha256_file_hex(dest);
        if (digest && *digest == pointer->oid) return Result<fs::path>::Ok(dest);
    }

    try {
        auto descriptors = client_.negotiate_batch({{pointer->oid, pointer->size}},
                                                   TransferDirection::Download);
        auto it = std::find_if(descriptors.begin(), descriptors.end(),
                               [&](const TransferDescriptor& d) { return d.object.oid == pointer->oid; });
        if (it == descriptors.end()) {
            return Result<fs::path>::Err("Server did not answer for " + pointer->oid);
        }
        client_.download(*it, dest);
    } catch (const LfsError& e) {
        return Result<fs::path>::Err(fmt::format("Failed to fetch {}: {}", pointer_path, e.what()));
    }

    tandem_log(fmt::format("lfs: fetched {} into {}", pointer_path, dest.string()));
    return Result<fs::path>::Ok(dest);
}

LfsStatus LfsReconciler::lfs_status() const {
    LfsStatus status;
    status.tracked_patterns = LfsAttributes(repo_dir_).tracked_patterns();
    for (const auto& path : list_pointer_files()) {
        auto text = platform::read_file(repo_dir_ / path);
        auto pointer = text ? parse_pointer(*text) : std::nullopt;
        if (!pointer) continue;
        status.pointer_files++;
        status.total_size += pointer->size;
    }
    status.missing_payloads = scan_missing_payloads().size();
    status.pending_uploads = scan_pending_uploads().size();
    return status;
}

Result<bool> LfsReconciler::ensure_payloads_ignored() {
    std::string entry = "/" + settings_.payload_prefix + "/";
    fs::path gitignore = repo_dir_ / ".gitignore";

    std::string content = platform::read_file(gitignore).value_or("");
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line == entry || line == entry.substr(1) ||
            line == settings_.payload_prefix || line == "/" + settings_.payload_prefix) {
            return Result<bool>::Ok(false);
        }
    }

    if (!content.empty() && content.back() != '\n') content += "\n";
    content += entry + "\n";
    auto written = platform::write_file(gitignore, content);
    if (written.is_err()) return Result<bool>::Err(written.error);
    return Result<bool>::Ok(true);
}
