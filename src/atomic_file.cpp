#include "quire/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace quire {

namespace {

std::atomic<unsigned> temp_counter{0};

// Makes the rename itself durable.
void sync_directory(const fs::path &dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1)
        return;
    ::fsync(fd);
    ::close(fd);
}

} // namespace

fs::path temp_path_for(const fs::path &target) {
    const unsigned n = temp_counter.fetch_add(1, std::memory_order_relaxed);
    fs::path tmp = target;
    tmp += std::format(".tmp.{}.{}", ::getpid(), n);
    return tmp;
}

Result<void> write_file_synced(const fs::path &tmp, std::string_view content) {
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(std::format("Failed to create {}: {}", tmp.string(), std::strerror(errno)));
    }

    const char *ptr = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            ::close(fd);
            std::error_code ec;
            fs::remove(tmp, ec);
            return std::unexpected(std::format("Failed to write {}: {}", tmp.string(), std::strerror(err)));
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        std::error_code ec;
        fs::remove(tmp, ec);
        return std::unexpected(std::format("Failed to flush {}: {}", tmp.string(), std::strerror(err)));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        return std::unexpected(std::format("Failed to close {}: {}", tmp.string(), std::strerror(err)));
    }
    return {};
}

Result<void> write_file_atomic(const fs::path &target, std::string_view content) {
    const fs::path tmp = temp_path_for(target);
    if (auto res = write_file_synced(tmp, content); !res)
        return res;
    return commit_file(tmp, target);
}

Result<void> commit_file(const fs::path &temp, const fs::path &target) {
    if (std::rename(temp.c_str(), target.c_str()) != 0) {
        const int err = errno;
        std::error_code ec;
        fs::remove(temp, ec);
        return std::unexpected(
            std::format("Failed to move {} into place at {}: {}", temp.string(), target.string(), std::strerror(err)));
    }
    sync_directory(target.parent_path());
    return {};
}

} // namespace quire
