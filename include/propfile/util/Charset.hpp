#pragma once
/// @file Charset.hpp
/// @brief Supported byte encodings and their transcoding to and from UTF-8

#include <propfile/util/DiagnosticSink.hpp>

#include <string>
#include <string_view>
#include <system_error>

namespace PropFile {

/// @brief Byte encodings a .properties document can be read from or written to
///
/// Text is always held as UTF-8 in memory. The charset only matters at the
/// byte boundary.
enum class Charset {
    Utf8,      ///< UTF-8 (default)
    Utf16,     ///< UTF-16 with byte order mark, big endian when writing
    Utf16LE,   ///< UTF-16 little endian, no byte order mark
    Utf16BE,   ///< UTF-16 big endian, no byte order mark
    Iso8859_1, ///< ISO-8859-1 (Latin-1)
    UsAscii    ///< 7-bit US-ASCII
};

/// @brief Canonical name of a charset ("UTF-8", "ISO-8859-1", ...)
const char* charsetName(Charset charset) noexcept;

/// @brief Whether the charset can represent every unicode character
/// @return true for the UTF-8 and UTF-16 family
bool isUnicodeCapable(Charset charset) noexcept;

/// @brief Look up a charset by name (case-insensitive, common aliases accepted)
/// @param name Charset name such as "utf-8", "latin1" or "ISO-8859-1"
/// @param out Parsed charset (unchanged on failure)
/// @param ec Set to Errc::UnsupportedCharset if the name is unknown
/// @return true on success
bool parseCharset(const std::string& name, Charset& out, std::error_code& ec);

/// @brief Decode raw bytes into UTF-8 text
///
/// Malformed input never fails: undecodable sequences become U+FFFD and a
/// single warning summarizing the replacements is sent to @p sink.
std::string decodeBytes(std::string_view bytes, Charset charset,
                        DiagnosticSink& sink = nullDiagnosticSink());

/// @brief Encode UTF-8 text into the byte representation of @p charset
///
/// Characters the charset cannot represent are written as '?' and reported
/// to @p sink.
std::string encodeText(std::string_view text, Charset charset,
                       DiagnosticSink& sink = nullDiagnosticSink());

} // namespace PropFile
