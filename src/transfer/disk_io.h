#pragma once

#include <omnifetch/core/types.h>

#include <cstdint>
#include <filesystem>

namespace omnifetch::transfer::detail {

Result<void> fsync_file(const std::filesystem::path& p);
Result<void> fsync_dir(const std::filesystem::path& dir);

/**
 * Append-only handle on a partial content file (0600 on creation).
 */
class PartialFile {
public:
    PartialFile() = default;
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    /**
     * Open `path` for appending, creating it if needed; truncated to `keepBytes` first.
     */
    Result<void> open(const std::filesystem::path& path, std::uint64_t keepBytes);

    /**
     * Discard the content (truncate to zero).
     */
    Result<void> reset();

    Result<void> append(ByteSpan data);

    /**
     * fdatasync; called after every chunk so the sidecar never runs ahead of the data.
     */
    Result<void> sync();

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
    std::filesystem::path path_;
};

} // namespace omnifetch::transfer::detail
