#pragma once
/// @file UniqueFd.hpp
/// @brief Owning wrapper for POSIX file descriptors (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace PropFile {
namespace detail {

/// @brief Owns one file descriptor and closes it exactly once
///
/// The destructor closes silently. Callers that must know whether the
/// close succeeded (a write path) call close(ec) explicitly first.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of a file descriptor
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// @brief open(2) wrapper, O_CLOEXEC added where available
    /// @param path File to open
    /// @param flags open(2) flags
    /// @param ec errno of a failed open
    /// @return Owning descriptor, invalid on failure
    static UniqueFd open(const std::string& path, int flags, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        UniqueFd fd(::open(path.c_str(), flags, 0644));
        if (!fd)
            ec = std::error_code(errno, std::generic_category());
        return fd;
    }

    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Give up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Close the current descriptor (errors ignored) and adopt a new one
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Close and report the result
    /// @param ec errno of a failed close(2)
    /// @return true if the descriptor was closed cleanly (or was not open)
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        // 실패하더라도 fd는 이미 해제된 것으로 보고 재시도하지 않는다.
        const int rc = ::close(fd_);
        fd_ = -1;
        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace PropFile
