/*
 * Durable file helpers for partial content and sidecars (POSIX).
 */

#include "disk_io.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace omnifetch::transfer::detail {

namespace fs = std::filesystem;

namespace {

Error errnoError(const char* what, const fs::path& p) {
    return Error{ErrorCode::IoError, std::string(what) + " failed for " + p.string() + ": " +
                                         std::strerror(errno)};
}

} // namespace

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return errnoError("open() for fsync", p);
    }
#if defined(__APPLE__)
    // On macOS, F_FULLFSYNC is stricter than fsync; do both, tolerating failures.
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        auto err = errnoError("fsync()", p);
        ::close(fd);
        return err;
    }
#endif
    ::close(fd);
    return {};
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return errnoError("open(O_DIRECTORY)", dir);
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        auto err = errnoError("fsync(dir)", dir);
        ::close(fd);
        return err;
    }
#endif
    ::close(fd);
    return {};
}

PartialFile::~PartialFile() {
    close();
}

Result<void> PartialFile::open(const fs::path& path, std::uint64_t keepBytes) {
    close();
    path_ = path;
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        return errnoError("open()", path);
    }
    if (::ftruncate(fd_, static_cast<off_t>(keepBytes)) != 0) {
        auto err = errnoError("ftruncate()", path);
        close();
        return err;
    }
    return {};
}

Result<void> PartialFile::reset() {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Partial file not open"};
    }
    if (::ftruncate(fd_, 0) != 0) {
        return errnoError("ftruncate()", path_);
    }
    return {};
}

Result<void> PartialFile::append(ByteSpan data) {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Partial file not open"};
    }
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return errnoError("write()", path_);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return {};
}

Result<void> PartialFile::sync() {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Partial file not open"};
    }
#if defined(__APPLE__)
    if (::fsync(fd_) != 0) {
#else
    if (::fdatasync(fd_) != 0) {
#endif
        return errnoError("fdatasync()", path_);
    }
    return {};
}

void PartialFile::close() noexcept {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            spdlog::warn("close() failed for {}: {}", path_.string(), std::strerror(errno));
        }
        fd_ = -1;
    }
}

} // namespace omnifetch::transfer::detail
