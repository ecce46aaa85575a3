#pragma once
/// @file PropertyFileWriter.hpp
/// @brief Serializes entries, applying the unicode handling policy

#include <propfile/Options.hpp>
#include <propfile/entry/Entry.hpp>
#include <propfile/util/DiagnosticSink.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace PropFile {

/// @brief Collects entries and writes them out in the configured charset
///
/// Each entry is written as its escaped text, transformed according to the
/// unicode handling policy, then encoded once when flushed.
class PropertyFileWriter {
  public:
    explicit PropertyFileWriter(Options options = Options(),
                                DiagnosticSink& sink = nullDiagnosticSink())
        : options_(options), sink_(&sink) {}

    /// @brief Append one entry
    void writeEntry(const Entry& entry);

    /// @brief Append several entries in order
    void writeEntries(const std::vector<Entry>& entries);

    /// @brief The text written so far, before charset encoding
    const std::string& text() const noexcept { return text_; }

    /// @brief The text written so far, encoded in the configured charset
    std::string encoded() const;

    /// @brief Flush the encoded bytes to a stream
    /// @param ec std::errc::io_error if the stream reports failure
    bool writeTo(std::ostream& os, std::error_code& ec) const;

    /// @brief Replace the content of an open descriptor with the encoded bytes
    bool writeTo(int fd, std::error_code& ec) const;

    /// @brief Create or replace a file with the encoded bytes
    /// @param path Target file
    /// @param createParents Create missing parent directories
    /// @param ec errno of the failing call
    bool writeToFile(const std::string& path, bool createParents, std::error_code& ec) const;

    const Options& options() const noexcept { return options_; }

    /// @brief Transform one entry's text according to a unicode policy
    static std::string applyUnicodeHandling(std::string_view text, UnicodeHandling handling,
                                            Charset charset,
                                            DiagnosticSink& sink = nullDiagnosticSink());

  private:
    Options options_;
    DiagnosticSink* sink_;
    std::string text_;
};

} // namespace PropFile
