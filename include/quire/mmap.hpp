#pragma once

#include "quire/utility.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string_view>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace quire {

/**
 * @brief Read-only memory mapped file.
 *
 * Used to hash source, template and output files without copying them into a string.
 * Handles resource cleanup via RAII. The constructor throws std::runtime_error on failure;
 * `open` wraps that into a Result.
 */
class MappedFile {
public:
    /**
     * @brief Opens and maps the specified file.
     * @param path The path to the file.
     * @throws std::runtime_error If opening, stating, or mapping fails.
     */
    explicit MappedFile(const std::filesystem::path &path) {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1) {
            throw std::runtime_error("Failed to open file: " + path.string());
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1) {
            ::close(fd_);
            throw std::runtime_error("Failed to stat file: " + path.string());
        }
        if (!S_ISREG(sb.st_mode)) {
            ::close(fd_);
            throw std::runtime_error("Not a regular file: " + path.string());
        }
        size_ = static_cast<size_t>(sb.st_size);

        // mmap rejects zero-length mappings.
        if (size_ == 0) {
            return;
        }

        posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);

        void *addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED) {
            ::close(fd_);
            throw std::runtime_error("Failed to mmap file: " + path.string());
        }
        data_ = static_cast<char *>(addr);
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            ::close(fd_);
        }
    }

    static Result<std::shared_ptr<MappedFile>> open(const std::filesystem::path &path) {
        try {
            return std::make_shared<MappedFile>(path);
        } catch (const std::exception &err) {
            return std::unexpected(err.what());
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    size_t size() const {
        return size_;
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace quire
