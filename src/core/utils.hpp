#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Milliseconds since the Unix epoch (wall clock).
int64_t now_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

std::string base64_encode(const std::string& input);

// Lowercase hex SHA-256 of a buffer.
std::string sha256_hex(const std::string& data);

// Lowercase hex SHA-256 of a file's contents, streamed. nullopt if unreadable.
std::optional<std::string> sha256_file_hex(const std::filesystem::path& path);

// Remove "user:pass@" from an http(s) URL.
std::string strip_url_credentials(const std::string& url);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
