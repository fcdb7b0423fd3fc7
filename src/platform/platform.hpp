#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

int current_pid();

// Short host name of this machine ("" if it cannot be determined).
std::string host_name();

// True if a process with this pid exists on this host. A pid owned by another
// user still counts as existing.
bool process_exists(int pid);

} // namespace platform
