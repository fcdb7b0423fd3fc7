#include "file_ops.hpp"
#include "platform.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <cstdio>

namespace fs = std::filesystem;

namespace platform {

static bool write_all(int fd, const std::string& content) {
    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return ::fsync(fd) == 0;
}

CreateStatus create_exclusive(const fs::path& path, const std::string& content,
                              std::string* error) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return CreateStatus::AlreadyExists;
        if (error) *error = std::strerror(errno);
        return CreateStatus::Failed;
    }

    bool ok = write_all(fd, content);
    int saved_errno = errno;
    ::close(fd);
    if (!ok) {
        // Leave no half-written lock behind
        ::unlink(path.c_str());
        if (error) *error = std::strerror(saved_errno);
        return CreateStatus::Failed;
    }
    return CreateStatus::Created;
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return ss.str();
}

Result<void> write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return Result<void>::Err("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    bool ok = write_all(fd, content);
    int saved_errno = errno;
    ::close(fd);
    if (!ok) {
        return Result<void>::Err("Cannot write " + path.string() + ": " + std::strerror(saved_errno));
    }
    return Result<void>::Ok();
}

Result<void> replace_file(const fs::path& from, const fs::path& to) {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return Result<void>::Err("Cannot rename " + from.string() + " to " + to.string() +
                                 ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<void> remove_file(const fs::path& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return Result<void>::Err("Cannot remove " + path.string() + ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

fs::path private_sibling(const fs::path& path, const std::string& tag) {
    static std::atomic<unsigned> counter{0};
    fs::path out = path;
    out += "." + tag + "." + std::to_string(current_pid()) + "." + std::to_string(counter++);
    return out;
}

TakeOverStatus remove_if_stale(const fs::path& path,
                               const std::function<bool(const fs::path&)>& is_stale,
                               std::string* error) {
    fs::path claimed = private_sibling(path, "claim");
    if (std::rename(path.c_str(), claimed.c_str()) != 0) {
        if (errno == ENOENT) return TakeOverStatus::Missing;
        if (error) *error = "Cannot claim " + path.string() + ": " + std::strerror(errno);
        return TakeOverStatus::Failed;
    }

    if (is_stale(claimed)) {
        auto r = remove_file(claimed);
        if (r.is_err()) {
            if (error) *error = r.error;
            return TakeOverStatus::Failed;
        }
        return TakeOverStatus::Removed;
    }

    // Put the live file back. link(2) refuses to replace a file created meanwhile.
    if (::link(claimed.c_str(), path.c_str()) != 0) {
        int saved_errno = errno;
        if (saved_errno == EEXIST) {
            ::unlink(claimed.c_str());
            return TakeOverStatus::Displaced;
        }
        // No hard links on this filesystem: plain rename back
        if (std::rename(claimed.c_str(), path.c_str()) == 0) return TakeOverStatus::NotStale;
        if (error) *error = "Cannot restore " + path.string() + ": " + std::strerror(saved_errno);
        return TakeOverStatus::Failed;
    }
    ::unlink(claimed.c_str());
    return TakeOverStatus::NotStale;
}

} // namespace platform
