#pragma once

#include <string>
#include <vector>
#include <mutex>

// Channel for errors that are recovered locally and must never abort the
// operation that hit them (heartbeat writes, stale-lock cleanup, temp-file
// removal). Every report is written to the debug log and kept in memory so
// callers and tests can see what was swallowed.
class NonFatalSink {
public:
    struct Entry {
        std::string where;
        std::string message;
    };

    void report(const std::string& where, const std::string& message);

    std::vector<Entry> entries() const;
    size_t count() const;
    bool contains(const std::string& where) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};
