#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>

std::string format_age(int64_t age_ms) {
    if (age_ms < 0) age_ms = 0;

    int64_t seconds = age_ms / 1000;
    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_clock(int64_t epoch_ms) {
    if (epoch_ms <= 0) return "-";

    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    struct tm tm_buf = {};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    // Format as "8:13pm" (12-hour with am/pm)
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    // Strip leading zero and lowercase am/pm: "08:13PM" → "8:13pm"
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}
