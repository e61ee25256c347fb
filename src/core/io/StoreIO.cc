// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file StoreIO.cc
 * @brief Implementation of secure snapshot file I/O
 */

#include "StoreIO.h"
#include "../../utils/Log.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace AuthKeep {

namespace {

// Closes a POSIX descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    // Close explicitly so the error can be checked
    [[nodiscard]] bool close_checked() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return close(fd) == 0;
    }

private:
    int fd_;
};

bool write_all(int fd, std::span<const uint8_t> data) {
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

AuthResult<std::vector<uint8_t>> StoreIO::read_file(const std::filesystem::path& path) {
    // Open with O_NOFOLLOW to prevent symlink attacks
    FdGuard fd(open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (fd.get() < 0) {
        const int err = errno;
        if (err == ENOENT) {
            return std::unexpected(AuthError::NotFound);
        }
        Log::error("StoreIO: failed to open {} ({})", path.string(), std::strerror(err));
        return std::unexpected(err == ELOOP ? AuthError::ConfigurationError : AuthError::InternalError);
    }

    // fstat on the opened descriptor (no TOCTOU)
    struct stat st{};
    if (fstat(fd.get(), &st) != 0) {
        Log::error("StoreIO: failed to stat {}", path.string());
        return std::unexpected(AuthError::InternalError);
    }

    if (!S_ISREG(st.st_mode)) {
        Log::error("StoreIO: {} is not a regular file", path.string());
        return std::unexpected(AuthError::ConfigurationError);
    }

    // Owner-only read/write required
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        Log::error("StoreIO: {} has insecure permissions (must be owner-only)", path.string());
        return std::unexpected(AuthError::ConfigurationError);
    }

    if (static_cast<size_t>(st.st_size) > MAX_FILE_SIZE) {
        Log::error("StoreIO: {} exceeds maximum size ({} bytes)", path.string(), st.st_size);
        return std::unexpected(AuthError::ConfigurationError);
    }

    std::vector<uint8_t> data(static_cast<size_t>(st.st_size));
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = read(fd.get(), data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Log::error("StoreIO: read error on {} ({})", path.string(), std::strerror(errno));
            return std::unexpected(AuthError::InternalError);
        }
        if (n == 0) {
            break;  // file shrank underneath us
        }
        offset += static_cast<size_t>(n);
    }
    data.resize(offset);
    return data;
}

AuthResult<void> StoreIO::write_file(
    const std::filesystem::path& path,
    std::span<const uint8_t> data) {

    namespace fs = std::filesystem;
    const fs::path temp_path = fs::path(path.string() + ".tmp");

    {
        FdGuard fd(open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                        S_IRUSR | S_IWUSR));
        if (fd.get() < 0) {
            Log::error("StoreIO: failed to create {} ({})", temp_path.string(), std::strerror(errno));
            return std::unexpected(AuthError::InternalError);
        }

        // O_CREAT mode is filtered by umask and ignored for an existing file
        if (fchmod(fd.get(), S_IRUSR | S_IWUSR) != 0 ||
            !write_all(fd.get(), data) ||
            fsync(fd.get()) != 0) {
            Log::error("StoreIO: failed to write {} ({})", temp_path.string(), std::strerror(errno));
            std::error_code ec;
            fs::remove(temp_path, ec);
            return std::unexpected(AuthError::InternalError);
        }

        if (!fd.close_checked()) {
            Log::error("StoreIO: failed to close {}", temp_path.string());
            std::error_code ec;
            fs::remove(temp_path, ec);
            return std::unexpected(AuthError::InternalError);
        }
    }

    // Atomic rename (POSIX guarantees atomicity)
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        Log::error("StoreIO: failed to rename {} ({})", temp_path.string(), ec.message());
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return std::unexpected(AuthError::InternalError);
    }

    // Sync directory to ensure rename is durable
    fs::path dir_path = path.parent_path();
    if (dir_path.empty()) {
        dir_path = ".";
    }
    FdGuard dir_fd(open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dir_fd.get() >= 0) {
        if (fsync(dir_fd.get()) != 0) {
            Log::warning("StoreIO: directory fsync failed for {}", dir_path.string());
        }
    }

    return {};
}

AuthResult<size_t> StoreIO::append_file(
    const std::filesystem::path& path,
    std::span<const uint8_t> data) {

    FdGuard fd(open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_NOFOLLOW | O_CLOEXEC,
                    S_IRUSR | S_IWUSR));
    if (fd.get() < 0) {
        const int err = errno;
        Log::error("StoreIO: failed to open {} for append ({})", path.string(), std::strerror(err));
        return std::unexpected(err == ELOOP ? AuthError::ConfigurationError : AuthError::InternalError);
    }

    struct stat st{};
    if (fstat(fd.get(), &st) != 0) {
        Log::error("StoreIO: failed to stat {}", path.string());
        return std::unexpected(AuthError::InternalError);
    }
    if (!S_ISREG(st.st_mode)) {
        Log::error("StoreIO: {} is not a regular file", path.string());
        return std::unexpected(AuthError::ConfigurationError);
    }
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        Log::error("StoreIO: {} has insecure permissions (must be owner-only)", path.string());
        return std::unexpected(AuthError::ConfigurationError);
    }

    const auto previous_size = st.st_size;
    if (!write_all(fd.get(), data) || fsync(fd.get()) != 0) {
        Log::error("StoreIO: failed to append to {} ({})", path.string(), std::strerror(errno));
        // Drop a torn record so the next append starts on a record boundary
        if (ftruncate(fd.get(), previous_size) != 0) {
            Log::warning("StoreIO: could not truncate {} after failed append", path.string());
        }
        return std::unexpected(AuthError::InternalError);
    }

    if (!fd.close_checked()) {
        Log::error("StoreIO: failed to close {}", path.string());
        return std::unexpected(AuthError::InternalError);
    }
    return static_cast<size_t>(previous_size) + data.size();
}

} // namespace AuthKeep
