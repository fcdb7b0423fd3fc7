#pragma once

#include <string>
#include <vector>
#include <optional>
#include <git/git_backend.hpp>
#include <lfs/gitattributes.hpp>

struct Conflict {
    std::string filepath;
    std::string ours;                   // "" when absent on our side
    std::string theirs;                 // "" when absent on their side
    std::optional<std::string> base;    // nullopt when the merge base lacks the path
    bool is_new = false;
    bool is_lfs = false;
    bool is_deleted = false;
};

enum class MergeDecision {
    Unchanged,      // both sides agree
    TakeTheirs,     // only the remote changed the path
    KeepOurs,       // only we changed the path
    Conflict,       // both changed it differently
};

// Decide one path from the blob ids on each side (nullopt = absent).
MergeDecision decide_path(const std::optional<std::string>& ours,
                          const std::optional<std::string>& theirs,
                          const std::optional<std::string>& base);

// A change to bring over from the remote side. nullopt content deletes.
struct MergeChange {
    std::string path;
    std::optional<std::string> content;
};

struct MergePlan {
    std::string base;                   // "" for unrelated histories
    std::string ours;
    std::string theirs;
    std::vector<MergeChange> changes;
    std::vector<Conflict> conflicts;

    bool clean() const { return conflicts.empty(); }
};

// Three-way comparison of two commits against their merge base. Identical
// blob ids mean identical bytes, so only paths whose ids differ are read.
class ConflictDetector {
public:
    ConflictDetector(GitBackend& git, const std::string& pointer_prefix);

    MergePlan plan(const std::string& ours, const std::string& theirs);

    // LFS-managed: tracked by .gitattributes on either side, under the
    // pointer tree, or either side's content is pointer text.
    bool is_lfs(const std::string& path, const std::string& ours_text,
                const std::string& theirs_text,
                const std::vector<const LfsAttributes*>& attributes) const;

private:
    GitBackend& git_;
    std::string pointer_prefix_;

    std::optional<LfsAttributes> attributes_at(const std::string& commit);
};
