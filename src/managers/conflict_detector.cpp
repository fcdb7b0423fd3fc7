#include "conflict_detector.hpp"
#include <lfs/pointer.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <set>

MergeDecision decide_path(const std::optional<std::string>& ours,
                          const std::optional<std::string>& theirs,
                          const std::optional<std::string>& base) {
    if (ours == theirs) return MergeDecision::Unchanged;
    if (ours == base) return MergeDecision::TakeTheirs;
    if (theirs == base) return MergeDecision::KeepOurs;
    return MergeDecision::Conflict;
}

static std::optional<std::string> lookup(const TreeListing& tree, const std::string& path) {
    auto it = tree.find(path);
    if (it == tree.end()) return std::nullopt;
    return it->second;
}

ConflictDetector::ConflictDetector(GitBackend& git, const std::string& pointer_prefix)
    : git_(git), pointer_prefix_(pointer_prefix) {
    while (!pointer_prefix_.empty() && pointer_prefix_.back() == '/') pointer_prefix_.pop_back();
}

std::optional<LfsAttributes> ConflictDetector::attributes_at(const std::string& commit) {
    auto text = git_.read_blob(commit, GITATTRIBUTES_FILE);
    if (!text) return std::nullopt;
    return LfsAttributes::from_text(*text);
}

bool ConflictDetector::is_lfs(const std::string& path, const std::string& ours_text,
                              const std::string& theirs_text,
                              const std::vector<const LfsAttributes*>& attributes) const {
    for (const auto* attrs : attributes) {
        if (attrs && attrs->is_tracked(path)) return true;
    }
    if (!pointer_prefix_.empty() && starts_with(path, pointer_prefix_ + "/")) return true;
    return looks_like_pointer(ours_text) || looks_like_pointer(theirs_text);
}

MergePlan ConflictDetector::plan(const std::string& ours, const std::string& theirs) {
    MergePlan plan;
    plan.ours = ours;
    plan.theirs = theirs;
    plan.base = git_.merge_base(ours, theirs).value_or("");

    TreeListing ours_tree = git_.list_files(ours);
    TreeListing theirs_tree = git_.list_files(theirs);
    TreeListing base_tree;
    if (!plan.base.empty()) base_tree = git_.list_files(plan.base);

    std::set<std::string> paths;
    for (const auto& [p, _] : ours_tree) paths.insert(p);
    for (const auto& [p, _] : theirs_tree) paths.insert(p);
    for (const auto& [p, _] : base_tree) paths.insert(p);

    auto ours_attrs = attributes_at(ours);
    auto theirs_attrs = attributes_at(theirs);
    std::vector<const LfsAttributes*> attrs = {
        ours_attrs ? &*ours_attrs : nullptr,
        theirs_attrs ? &*theirs_attrs : nullptr,
    };

    for (const auto& path : paths) {
        auto o = lookup(ours_tree, path);
        auto t = lookup(theirs_tree, path);
        auto b = lookup(base_tree, path);

        switch (decide_path(o, t, b)) {
            case MergeDecision::Unchanged:
            case MergeDecision::KeepOurs:
                break;

            case MergeDecision::TakeTheirs: {
                MergeChange change{path, std::nullopt};
                if (t) {
                    change.content = git_.read_blob(theirs, path);
                    if (!change.content) {
                        throw GitError(GitErrorKind::NotFound,
                                       fmt::format("{} vanished from {}", path, theirs));
                    }
                }
                plan.changes.push_back(std::move(change));
                break;
            }

            case MergeDecision::Conflict: {
                Conflict c;
                c.filepath = path;
                c.ours = o ? git_.read_blob(ours, path).value_or("") : "";
                c.theirs = t ? git_.read_blob(theirs, path).value_or("") : "";
                if (b) c.base = git_.read_blob(plan.base, path).value_or("");
                c.is_new = !b;
                c.is_deleted = !o || !t;
                c.is_lfs = is_lfs(path, c.ours, c.theirs, attrs);
                plan.conflicts.push_back(std::move(c));
                break;
            }
        }
    }

    tandem_log(fmt::format("merge plan {}..{} (base {}): {} changes, {} conflicts",
                           ours.substr(0, 8), theirs.substr(0, 8),
                           plan.base.empty() ? "none" : plan.base.substr(0, 8),
                           plan.changes.size(), plan.conflicts.size()));
    return plan;
}
