// ============================================================================
// Strongbox - File I/O Helpers
// ============================================================================
// Both persistent files (master key and data file) go through these helpers:
// - read_file: whole-file read with a size cap
// - atomic_write_file: temp file + fsync + rename, so a crash mid-write never
//   leaves a truncated key or data file behind
// - FileLock: exclusive advisory lock serializing concurrent invocations
// ============================================================================

#ifndef STRONGBOX_FILE_IO_HPP
#define STRONGBOX_FILE_IO_HPP

#include "types.hpp"
#include <filesystem>

namespace strongbox {

/// Read a whole file into memory
/// @param path File to read
/// @param max_size Files larger than this are rejected with FileTooLarge
/// @return File contents, or FileNotFound / FileReadError / FileTooLarge
[[nodiscard]] Result<ByteBuffer> read_file(
    const std::filesystem::path& path,
    std::size_t max_size = constants::MAX_DATA_FILE_SIZE
);

/// Replace a file's contents atomically
///
/// The data is written to a temporary file in the same directory with
/// owner-only permissions (0600), flushed to disk, and renamed over `path`.
/// Readers observe either the old or the new contents, never a mix.
/// @return Success, or FileWriteError
[[nodiscard]] VoidResult atomic_write_file(
    const std::filesystem::path& path,
    ByteSpan data
);

/// RAII exclusive lock on a lock file (flock). Released on destruction.
class FileLock {
public:
    /// Block until an exclusive lock on `path` is held. Creates the lock
    /// file if needed.
    /// @return The held lock, or FileLockFailed
    [[nodiscard]] static Result<FileLock> acquire(const std::filesystem::path& path);

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    ~FileLock();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileLock(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    void release() noexcept;

    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace strongbox

#endif // STRONGBOX_FILE_IO_HPP
