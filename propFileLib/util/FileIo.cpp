#include <propfile/util/FileIo.hpp>
#include <propfile/util/FileLockGuard.hpp>

#include <sys/stat.h>

#include <filesystem>

namespace PropFile {
namespace detail {

namespace fs = std::filesystem;

bool readAll(int fd, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0)
        out.reserve(static_cast<size_t>(st.st_size));

    char buf[8192];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            return true;
        } else if (errno != EINTR) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
    }
}

bool writeAll(int fd, std::string_view data, std::error_code& ec) {
    ec.clear();
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        // short write는 남은 부분을 이어서 기록한다.
        written += static_cast<size_t>(n);
    }
    return true;
}

bool replaceContents(int fd, std::string_view data, std::error_code& ec) {
    ec.clear();
    if (::ftruncate(fd, 0) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (!writeAll(fd, data, ec))
        return false;
    if (::fsync(fd) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

void closeReporting(UniqueFd& fd, const std::string& path, DiagnosticSink& sink) {
    std::error_code ec;
    if (!fd.close(ec))
        sink.report(Severity::Warning, "Error closing " + path + ": " + ec.message());
}

bool readFile(const std::string& path, std::string& out, std::error_code& ec,
              DiagnosticSink& sink) {
    UniqueFd fd = UniqueFd::open(path, O_RDONLY, ec);
    if (ec)
        return false;

    bool ok = false;
    {
        FileLockGuard lock(fd.get(), FileLockGuard::Mode::Shared, ec);
        if (!ec)
            ok = readAll(fd.get(), out, ec);

        std::error_code unlockEc;
        if (lock.locked() && !lock.unlock(unlockEc))
            sink.report(Severity::Warning, "Error unlocking " + path + ": " + unlockEc.message());
    }

    closeReporting(fd, path, sink);
    return ok;
}

bool writeFile(const std::string& path, std::string_view data, bool createParents,
               std::error_code& ec, DiagnosticSink& sink) {
    ec.clear();

    if (createParents) {
        // 상위 디렉토리가 없으면 먼저 만든다.
        const fs::path dir = fs::path(path).parent_path();
        if (!dir.empty()) {
            std::error_code fec;
            if (!fs::exists(dir, fec)) {
                fs::create_directories(dir, fec);
                if (fec) {
                    ec = fec;
                    return false;
                }
            }
        }
    }

    // O_TRUNC 대신 잠금을 잡은 뒤 ftruncate로 비운다.
    UniqueFd fd = UniqueFd::open(path, O_WRONLY | O_CREAT, ec);
    if (ec)
        return false;

    bool ok = false;
    {
        FileLockGuard lock(fd.get(), FileLockGuard::Mode::Exclusive, ec);
        if (!ec)
            ok = replaceContents(fd.get(), data, ec);

        std::error_code unlockEc;
        if (lock.locked() && !lock.unlock(unlockEc))
            sink.report(Severity::Warning, "Error unlocking " + path + ": " + unlockEc.message());
    }

    closeReporting(fd, path, sink);
    return ok;
}

bool fileExists(const std::string& path) noexcept {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace detail
} // namespace PropFile
