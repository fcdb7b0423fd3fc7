#include "nonfatal.hpp"
#include "log.hpp"

void NonFatalSink::report(const std::string& where, const std::string& message) {
    tandem_log(fmt::format("non-fatal [{}]: {}", where, message));
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({where, message});
}

std::vector<NonFatalSink::Entry> NonFatalSink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t NonFatalSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool NonFatalSink::contains(const std::string& where) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.where == where) return true;
    }
    return false;
}

void NonFatalSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}
