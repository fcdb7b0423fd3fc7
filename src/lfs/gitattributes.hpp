#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// The LFS-tracked path set declared by .gitattributes (lines carrying
// filter=lfs). Later lines override earlier ones, as in git.
class LfsAttributes {
public:
    explicit LfsAttributes(const fs::path& repo_dir);

    // Parse attribute text directly (e.g. a blob read from a commit)
    static LfsAttributes from_text(const std::string& content);

    bool is_tracked(const std::string& path) const;

    // Patterns currently tracked, in file order
    std::vector<std::string> tracked_patterns() const;

    // Append "<pattern> filter=lfs diff=lfs merge=lfs -text" unless already tracked.
    Result<void> track_pattern(const std::string& pattern);

private:
    LfsAttributes() = default;

    struct Rule {
        std::string pattern;
        bool lfs;                   // filter=lfs set (false: filter unset / other)
    };

    void parse(const std::string& content);
    bool matches_pattern(const std::string& path, const std::string& pattern) const;
    std::string glob_to_regex(const std::string& glob) const;

    fs::path attributes_path_;
    std::vector<Rule> rules_;
};
