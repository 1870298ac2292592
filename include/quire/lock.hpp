#pragma once

#include "quire/utility.hpp"

#include <chrono>
#include <filesystem>

namespace quire {

/**
 * @brief Exclusive advisory lock on `<cache-dir>/.build-lock`.
 *
 * Enforces the single-writer rule for the manifest across processes: `build` holds it for a
 * whole cycle, `invalidate` for the duration of its append. The lock is released when the
 * object is destroyed or the process dies.
 */
class BuildLock {
public:
    /**
     * @brief Acquires the lock, retrying until @p timeout elapses.
     * @return The held lock, or an error naming the current holder if it could not be taken.
     */
    static Result<BuildLock> acquire(const std::filesystem::path &cache_dir, std::chrono::milliseconds timeout);

    BuildLock(BuildLock &&other) noexcept;
    BuildLock &operator=(BuildLock &&other) noexcept;
    BuildLock(const BuildLock &) = delete;
    BuildLock &operator=(const BuildLock &) = delete;
    ~BuildLock();

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    BuildLock(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {
    }

    void release();

    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace quire
