#pragma once
/// @file PropertyFileReader.hpp
/// @brief Streams entries out of decoded .properties text

#include <propfile/entry/Entry.hpp>
#include <propfile/io/LogicalLineReader.hpp>
#include <propfile/util/Charset.hpp>
#include <propfile/util/DiagnosticSink.hpp>

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace PropFile {

/// @brief Reads one Entry per logical line
///
/// The reader works on already decoded UTF-8 text. The factory functions
/// take care of reading and decoding from a file, a byte buffer or a stream.
class PropertyFileReader {
  public:
    /// @param text Decoded document text
    explicit PropertyFileReader(std::string text) : lines_(std::move(text)) {}

    /// @brief Read and decode a whole file under a shared lock
    /// @param path File to read
    /// @param charset Encoding of the file
    /// @param ec errno of the failing call
    /// @param sink Receives decoding and close warnings
    /// @return std::nullopt on I/O failure
    static std::optional<PropertyFileReader> open(const std::string& path, Charset charset,
                                                  std::error_code& ec,
                                                  DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Decode raw bytes
    static PropertyFileReader fromBytes(std::string_view bytes, Charset charset,
                                        DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Drain and decode a byte stream
    /// @param ec std::errc::io_error if the stream fails before EOF
    static std::optional<PropertyFileReader> fromStream(std::istream& is, Charset charset,
                                                        std::error_code& ec,
                                                        DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Next entry, or std::nullopt at end of input
    std::optional<Entry> readEntry();

    /// @brief All remaining entries
    std::vector<Entry> readAll();

  private:
    LogicalLineReader lines_;
};

} // namespace PropFile
