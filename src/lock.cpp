#include "quire/lock.hpp"

#include "quire/log.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace quire {

namespace {

std::string read_holder(int fd) {
    char buf[256];
    ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0)
        return "unknown";
    std::string holder(buf, static_cast<size_t>(n));
    while (!holder.empty() && (holder.back() == '\n' || holder.back() == '\r'))
        holder.pop_back();
    return holder;
}

void write_holder(int fd) {
    char host[256] = {};
    ::gethostname(host, sizeof(host) - 1);
    const std::string info = std::format("pid={} host={}\n", ::getpid(), host);
    if (::ftruncate(fd, 0) == 0) {
        ssize_t n = ::pwrite(fd, info.data(), info.size(), 0);
        if (n < 0)
            log::debug("Could not record lock holder: {}", std::strerror(errno));
    }
}

} // namespace

Result<BuildLock> BuildLock::acquire(const fs::path &cache_dir, std::chrono::milliseconds timeout) {
    fs::path lock_path = cache_dir / ".build-lock";

    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(std::format("Failed to open build lock {}: {}", lock_path.string(), std::strerror(errno)));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool reported = false;
    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            const int err = errno;
            ::close(fd);
            return std::unexpected(std::format("Failed to lock {}: {}", lock_path.string(), std::strerror(err)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::string holder = read_holder(fd);
            ::close(fd);
            return std::unexpected(
                std::format("Timed out waiting for build lock {} (held by {})", lock_path.string(), holder));
        }
        if (!reported) {
            log::info("Waiting for another quire process ({})...", read_holder(fd));
            reported = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    write_holder(fd);
    return BuildLock(fd, std::move(lock_path));
}

BuildLock::BuildLock(BuildLock &&other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

BuildLock &BuildLock::operator=(BuildLock &&other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

BuildLock::~BuildLock() {
    release();
}

void BuildLock::release() {
    if (fd_ == -1)
        return;
    if (::ftruncate(fd_, 0) != 0)
        log::debug("Could not clear build lock {}: {}", path_.string(), std::strerror(errno));
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace quire
