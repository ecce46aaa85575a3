#pragma once
/// @file escapeUtil.hpp
/// @brief Conversions between escaped file text and logical key/value strings
///
/// "Escaped" text is exactly what appears in a .properties file: backslash
/// escapes, \\uXXXX sequences and continued lines included. "Unescaped" text
/// is the logical string used for lookups. The two domains are never mixed
/// implicitly: every conversion goes through one of these functions.

#include <propfile/util/DiagnosticSink.hpp>

#include <string>
#include <string_view>

namespace PropFile::util {

/// @brief Resolve all escapes of a key or value
///
/// - \\uXXXX (exactly 4 hex digits, any case) becomes the code point;
///   surrogate pairs are joined. Malformed or truncated sequences stay
///   literal and are reported to @p sink as errors.
/// - \\\\ becomes \\, \\n and \\r become LF and CR.
/// - A backslash before a real line break joins the lines.
/// - Any other backslash is dropped and the following character kept.
/// - A trailing lone backslash is dropped.
/// - Real line breaks are removed, together with the space, tab and
///   formfeed characters that start the following line.
std::string unescape(std::string_view s, DiagnosticSink& sink = nullDiagnosticSink());

/// @brief Resolve only \\uXXXX escapes, leaving every other escape in place
std::string unescapeUnicode(std::string_view s, DiagnosticSink& sink = nullDiagnosticSink());

/// @brief Escape a logical key for writing
///
/// Prefixes space, tab, formfeed, '=', ':', LF, CR, '#', '!' and '\\' with a
/// backslash. A CRLF pair is escaped once, as a unit.
std::string escapeKey(std::string_view s);

/// @brief Escape a logical value for writing
///
/// LF becomes \\n, CR becomes \\r and '\\' becomes \\\\. Everything else,
/// separators and whitespace included, is kept.
std::string escapeValue(std::string_view s);

/// @brief Replace every character above U+007F with a \\uXXXX escape
///
/// Characters outside the BMP are written as a surrogate pair of escapes.
std::string escapeUnicode(std::string_view s);

/// @brief Escape a single code point unconditionally (ASCII included)
std::string escapeUnicode(char32_t codepoint);

/// @brief Comment out (possibly multi-line) text
///
/// Prepends '#' and repeats it after every LF, CR or CRLF that is followed
/// by more characters.
std::string commentOut(std::string_view s);

/// @brief Drop space, tab and formfeed at the start of every line
std::string removeLeadingWhitespace(std::string_view s);

/// @brief Space, tab or formfeed
inline bool isWhitespace(char c) { return c == ' ' || c == '\t' || c == '\f'; }

/// @brief LF or CR
inline bool isLineBreak(char c) { return c == '\n' || c == '\r'; }

} // namespace PropFile::util
