#include "pointer.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <sstream>

bool is_valid_oid(const std::string& oid) {
    if (oid.size() != 64) return false;
    for (char c : oid) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

bool looks_like_pointer(const std::string& text) {
    if (text.size() > static_cast<size_t>(LFS_POINTER_MAX_BYTES)) return false;
    return starts_with(text, std::string("version ") + LFS_POINTER_VERSION);
}

std::optional<LfsPointer> parse_pointer(const std::string& text) {
    if (!looks_like_pointer(text)) return std::nullopt;

    std::istringstream in(text);
    std::string line;
    std::optional<std::string> oid;
    std::optional<uint64_t> size;

    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;

        auto space = line.find(' ');
        if (space == std::string::npos) return std::nullopt;
        std::string key = line.substr(0, space);
        std::string value = line.substr(space + 1);

        if (key == "oid") {
            if (!starts_with(value, "sha256:")) return std::nullopt;
            value = value.substr(7);
            if (!is_valid_oid(value)) return std::nullopt;
            oid = value;
        } else if (key == "size") {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                return std::nullopt;
            }
            try {
                size = std::stoull(value);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        // version and ext-* lines carry nothing we need
    }

    if (!oid || !size) return std::nullopt;
    return LfsPointer{*oid, *size};
}

std::string format_pointer(const LfsPointer& pointer) {
    return std::string("version ") + LFS_POINTER_VERSION + "\n" +
           "oid sha256:" + pointer.oid + "\n" +
           "size " + std::to_string(pointer.size) + "\n";
}

LfsPointer pointer_for_content(const std::string& content) {
    return LfsPointer{sha256_hex(content), content.size()};
}
