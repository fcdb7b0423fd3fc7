#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Small text stand-in for a large object stored out of line:
//   version https://git-lfs.github.com/spec/v1
//   oid sha256:<64 hex>
//   size <bytes>
struct LfsPointer {
    std::string oid;        // lowercase sha256 hex
    uint64_t size = 0;

    bool operator==(const LfsPointer& other) const {
        return oid == other.oid && size == other.size;
    }
    bool operator!=(const LfsPointer& other) const { return !(*this == other); }
};

std::optional<LfsPointer> parse_pointer(const std::string& text);
std::string format_pointer(const LfsPointer& pointer);

// Cheap check used by conflict detection: does this blob look like pointer text?
bool looks_like_pointer(const std::string& text);

bool is_valid_oid(const std::string& oid);

// Pointer describing `content` (sha256 + length).
LfsPointer pointer_for_content(const std::string& content);
