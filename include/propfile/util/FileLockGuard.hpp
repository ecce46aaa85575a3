#pragma once
/// @file FileLockGuard.hpp
/// @brief Whole-file fcntl lock held for the duration of a read or update (internal)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace PropFile {
namespace detail {

/// @brief Scoped whole-file fcntl lock
///
/// Readers take a shared lock, update-in-place takes an exclusive lock so
/// the read-modify-write of a document is not interleaved with another
/// cooperating process. Blocks (F_SETLKW) until the lock is granted.
///
/// @note This class is for internal library use.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK, several readers at once
        Exclusive ///< F_WRLCK, single writer
    };

    FileLockGuard() = default;

    /// @brief Acquire a lock on @p fd
    /// @param ec errno of a failed fcntl
    FileLockGuard(int fd, Mode mode, std::error_code& ec) { lock(fd, mode, ec); }

    /// @brief Releases the lock; a failed release is not reported here
    ~FileLockGuard() {
        std::error_code ignored;
        unlock(ignored);
    }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    FileLockGuard(FileLockGuard&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    FileLockGuard& operator=(FileLockGuard&& other) noexcept {
        if (this != &other) {
            std::error_code ignored;
            unlock(ignored);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// @brief Acquire the lock, releasing any lock held before
    /// @return true on success
    bool lock(int fd, Mode mode, std::error_code& ec) {
        std::error_code unlockEc;
        unlock(unlockEc);
        ec.clear();

        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }

        // l_len = 0: 파일 전체를 잠근다.
        if (!apply(fd, mode == Mode::Shared ? F_RDLCK : F_WRLCK, F_SETLKW)) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        fd_ = fd;
        return true;
    }

    /// @brief Release the lock explicitly
    /// @param ec errno of a failed release
    /// @return true if nothing was held or the release succeeded
    bool unlock(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        const bool ok = apply(fd_, F_UNLCK, F_SETLK);
        if (!ok)
            ec = std::error_code(errno, std::generic_category());
        // 실패해도 이중 해제를 막기 위해 상태는 해제로 정리한다.
        fd_ = -1;
        return ok;
    }

    bool locked() const noexcept { return fd_ >= 0; }

  private:
    static bool apply(int fd, short type, int cmd) noexcept {
        struct flock fl{};
        fl.l_type = type;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        return ::fcntl(fd, cmd, &fl) == 0;
    }

    int fd_ = -1;
};

} // namespace detail
} // namespace PropFile
