#pragma once
/// @file PropertyFormat.hpp
/// @brief Layout parsed from a reformat format string

#include <propfile/util/DiagnosticSink.hpp>

#include <string>
#include <system_error>

namespace PropFile {

/// @brief Whitespace, separator and line ending applied by Reformatter
struct PropertyFormat {
    std::string leadingWhitespace;
    std::string separator;
    std::string lineEnding;

    bool operator==(const PropertyFormat& other) const {
        return leadingWhitespace == other.leadingWhitespace && separator == other.separator &&
               lineEnding == other.lineEnding;
    }
    bool operator!=(const PropertyFormat& other) const { return !(*this == other); }
};

/// @brief Parse a layout such as "<key> = <value>\\n"
///
/// Grammar (placeholders case-insensitive, escapes written as two
/// characters, lowercase):
///
///     (" " | "\t" | "\f")* "<key>" separator "<value>" ("\n" | "\r" | "\r\n")
///
/// where separator is at least one of " ", "\t", "\f", "=", ":" and holds
/// at most one "=" or ":".
///
/// @param format Format string
/// @param out Receives the parsed layout with escapes converted to real characters
/// @param ec Errc::InvalidFormat if the string does not match
/// @param sink Receives an Error diagnostic naming the rejected string
bool parseFormat(const std::string& format, PropertyFormat& out, std::error_code& ec,
                 DiagnosticSink& sink = nullDiagnosticSink());

} // namespace PropFile
