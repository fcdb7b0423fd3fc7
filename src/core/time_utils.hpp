#pragma once

#include <string>
#include <cstdint>

// Format an age in milliseconds as "2h35m", "14m22s" or "8s".
// Negative ages (clock skew between processes) are shown as "0s".
std::string format_age(int64_t age_ms);

// Format an epoch-millisecond timestamp as a local "8:13pm" clock time.
// Returns "-" for 0 (never set).
std::string format_clock(int64_t epoch_ms);
