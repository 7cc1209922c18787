// ============================================================================
// Strongbox - File I/O Helpers Implementation
// ============================================================================

#include "strongbox/file_io.hpp"

// POSIX headers
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

// Standard library
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

namespace strongbox {

namespace {

/// write(2) until everything is out or an error occurs
bool write_all(int fd, ByteSpan data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

/// Make the rename durable by syncing the containing directory
void sync_directory(const std::filesystem::path& dir) {
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        ::fsync(dir_fd);
        ::close(dir_fd);
    }
}

} // namespace

// ============================================================================
// Reading
// ============================================================================

Result<ByteBuffer> read_file(const std::filesystem::path& path, std::size_t max_size) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ec ? ErrorCode::FileReadError : ErrorCode::FileNotFound);
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(ErrorCode::FileReadError);
    }
    if (file_size > max_size) {
        return std::unexpected(ErrorCode::FileTooLarge);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ErrorCode::FileReadError);
    }

    ByteBuffer contents(static_cast<std::size_t>(file_size));
    if (!contents.empty()) {
        file.read(reinterpret_cast<char*>(contents.data()),
                  static_cast<std::streamsize>(contents.size()));
        if (!file) {
            return std::unexpected(ErrorCode::FileReadError);
        }
    }

    return contents;
}

// ============================================================================
// Atomic Writing
// ============================================================================

VoidResult atomic_write_file(const std::filesystem::path& path, ByteSpan data) {
    std::filesystem::path dir = path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    // mkstemp needs a mutable, NUL-terminated template in the target directory
    // so the final rename never crosses a filesystem boundary
    std::string tmpl = (dir / (path.filename().string() + ".tmpXXXXXX")).string();
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    int fd = ::mkostemp(temp.data(), O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    auto fail = [&]() -> VoidResult {
        ::close(fd);
        ::unlink(temp.data());
        return std::unexpected(ErrorCode::FileWriteError);
    };

    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        return fail();
    }
    if (!write_all(fd, data)) {
        return fail();
    }
    if (::fsync(fd) != 0) {
        return fail();
    }
    if (::close(fd) != 0) {
        ::unlink(temp.data());
        return std::unexpected(ErrorCode::FileWriteError);
    }

    if (::rename(temp.data(), path.c_str()) != 0) {
        ::unlink(temp.data());
        return std::unexpected(ErrorCode::FileWriteError);
    }

    sync_directory(dir);
    return {};
}

// ============================================================================
// File Lock
// ============================================================================

Result<FileLock> FileLock::acquire(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return std::unexpected(ErrorCode::FileLockFailed);
    }

    int rc;
    do {
        rc = ::flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        ::close(fd);
        return std::unexpected(ErrorCode::FileLockFailed);
    }

    return FileLock(fd, path);
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileLock::~FileLock() {
    release();
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace strongbox
