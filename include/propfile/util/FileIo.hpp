#pragma once
/// @file FileIo.hpp
/// @brief Whole-file read and write on POSIX descriptors (internal implementation)

#include <propfile/util/DiagnosticSink.hpp>
#include <propfile/util/UniqueFd.hpp>

#include <string>
#include <string_view>
#include <system_error>

namespace PropFile {
namespace detail {

/// @brief Read from the current offset of @p fd until EOF (EINTR retried)
bool readAll(int fd, std::string& out, std::error_code& ec);

/// @brief Write all of @p data, handling short writes (EINTR retried)
bool writeAll(int fd, std::string_view data, std::error_code& ec);

/// @brief Replace the whole content of @p fd with @p data and fsync
///
/// Truncates, rewinds, writes and syncs on the same descriptor.
bool replaceContents(int fd, std::string_view data, std::error_code& ec);

/// @brief Close @p fd, reporting a failure to @p sink
///
/// A failed close is a warning only: it never overrides the result of the
/// operation the descriptor was used for.
void closeReporting(UniqueFd& fd, const std::string& path, DiagnosticSink& sink);

/// @brief Read a complete file under a shared lock
/// @param path File to read
/// @param out Receives the raw bytes
/// @param ec errno of the failing call
/// @param sink Receives close/unlock warnings
bool readFile(const std::string& path, std::string& out, std::error_code& ec,
              DiagnosticSink& sink = nullDiagnosticSink());

/// @brief Create or replace a file under an exclusive lock
/// @param path File to write
/// @param data Bytes to write
/// @param createParents Create missing parent directories first
/// @param ec errno of the failing call (or a filesystem error)
/// @param sink Receives close/unlock warnings
bool writeFile(const std::string& path, std::string_view data, bool createParents,
               std::error_code& ec, DiagnosticSink& sink = nullDiagnosticSink());

/// @brief Whether @p path names an existing file
bool fileExists(const std::string& path) noexcept;

} // namespace detail
} // namespace PropFile
