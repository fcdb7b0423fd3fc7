#include "gitattributes.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/file_ops.hpp>
#include <algorithm>
#include <regex>
#include <sstream>

LfsAttributes::LfsAttributes(const fs::path& repo_dir)
    : attributes_path_(repo_dir / GITATTRIBUTES_FILE) {
    if (auto content = platform::read_file(attributes_path_)) {
        parse(*content);
    }
}

LfsAttributes LfsAttributes::from_text(const std::string& content) {
    LfsAttributes attrs;
    attrs.parse(content);
    return attrs;
}

void LfsAttributes::parse(const std::string& content) {
    rules_.clear();
    std::istringstream in(content);
    std::string line;

    while (std::getline(in, line)) {
        trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream fields(line);
        std::string pattern;
        fields >> pattern;

        // Only lines that mention the filter attribute change LFS tracking
        std::string attr;
        bool mentions_filter = false;
        bool lfs = false;
        while (fields >> attr) {
            if (attr == "filter=lfs") {
                mentions_filter = true;
                lfs = true;
            } else if (attr == "-filter" || attr == "!filter" || starts_with(attr, "filter=")) {
                mentions_filter = true;
                lfs = false;
            }
        }
        if (mentions_filter) {
            rules_.push_back({pattern, lfs});
        }
    }
}

bool LfsAttributes::is_tracked(const std::string& path) const {
    std::string rel_path = path;

    // Normalize path separators for pattern matching
    std::replace(rel_path.begin(), rel_path.end(), '\\', '/');
    while (starts_with(rel_path, "/")) rel_path.erase(0, 1);

    bool tracked = false;

    // Process rules in order (later rules override earlier ones)
    for (const auto& rule : rules_) {
        if (matches_pattern(rel_path, rule.pattern)) {
            tracked = rule.lfs;
        }
    }

    return tracked;
}

std::vector<std::string> LfsAttributes::tracked_patterns() const {
    std::vector<std::string> out;
    for (const auto& rule : rules_) {
        auto it = std::find(out.begin(), out.end(), rule.pattern);
        if (rule.lfs && it == out.end()) out.push_back(rule.pattern);
        if (!rule.lfs && it != out.end()) out.erase(it);
    }
    return out;
}

Result<void> LfsAttributes::track_pattern(const std::string& pattern) {
    if (pattern.empty() || pattern.find_first_of(" \t\r\n") != std::string::npos) {
        return Result<void>::Err("Invalid LFS pattern '" + pattern + "'");
    }
    auto current = tracked_patterns();
    if (std::find(current.begin(), current.end(), pattern) != current.end()) {
        return Result<void>::Ok();
    }
    if (attributes_path_.empty()) {
        return Result<void>::Err("Attributes were not loaded from a repository");
    }

    std::string content = platform::read_file(attributes_path_).value_or("");
    if (!content.empty() && content.back() != '\n') content += "\n";
    content += pattern + " filter=lfs diff=lfs merge=lfs -text\n";

    auto w = platform::write_file(attributes_path_, content);
    if (w.is_err()) return w;

    rules_.push_back({pattern, true});
    return Result<void>::Ok();
}

bool LfsAttributes::matches_pattern(const std::string& path, const std::string& raw) const {
    std::string pattern = raw;
    bool anchored = starts_with(pattern, "/");
    if (anchored) pattern.erase(0, 1);

    // Directory rules ("dir/") cover everything below them
    if (!pattern.empty() && pattern.back() == '/') {
        pattern += "**";
    }

    // A pattern without a slash matches the file name at any depth
    bool has_slash = pattern.find('/') != std::string::npos;
    std::string subject = path;
    if (!has_slash && !anchored) {
        auto slash = path.rfind('/');
        if (slash != std::string::npos) subject = path.substr(slash + 1);
    }

    if (pattern.find_first_of("*?[") == std::string::npos) {
        return subject == pattern;
    }

    try {
        std::regex re(glob_to_regex(pattern));
        return std::regex_match(subject, re);
    } catch (const std::regex_error&) {
        return false;
    }
}

std::string LfsAttributes::glob_to_regex(const std::string& glob) const {
    std::string regex;
    bool escape = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (escape) {
            regex += '\\';
            regex += c;
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == '*') {
            // Check for **
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                // "**/" also matches zero directories
                if (i + 2 < glob.length() && glob[i + 2] == '/') {
                    regex += "(.*/)?";
                    i += 2;
                } else {
                    regex += ".*";
                    i++;
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[' || c == ']') {
            regex += c;
        } else if (std::string(".^$+(){}|").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return regex;
}
