#pragma once
/// @file EntryParser.hpp
/// @brief Splits one logical line into an Entry

#include <propfile/entry/Entry.hpp>

#include <string>
#include <string_view>

namespace PropFile {

/// @brief Classifies and decomposes logical lines
///
/// Parsing is total: every input produces some Entry. All fields of the
/// resulting PropertyEntry keep their escaped text.
class EntryParser {
  public:
    /// @brief Parse one logical line (as produced by LogicalLineReader)
    static Entry parse(std::string_view logicalLine);

    /// @brief First non-whitespace character is '#' or '!'
    static bool isComment(std::string_view logicalLine);

    /// @brief Only whitespace, possibly ended by a backslash before a line break
    static bool isBlank(std::string_view logicalLine);

    /// @brief Leading space/tab/formfeed; empty when the line starts with a separator
    static std::string_view parseLeadingWhitespace(std::string_view logicalLine);

    /// @brief The escaped key starting at @p startAt
    static std::string_view parseKey(std::string_view logicalLine, size_t startAt);

    /// @brief Whitespace run with at most one '=' or ':' starting at @p startAt
    static std::string_view parseSeparator(std::string_view logicalLine, size_t startAt);

    /// @brief Value and line ending, leading whitespace skipped
    static std::string_view parseValue(std::string_view logicalLine, size_t startAt);

    /// @brief Split trailing CR/LF characters off a value
    /// @param valueWithLineEnding Output of parseValue
    /// @param value Receives the value without line ending
    /// @param lineEnding Receives the line ending, "\n" if there was none
    static void splitValueAndLineEnding(std::string_view valueWithLineEnding,
                                        std::string_view& value, std::string_view& lineEnding);
};

} // namespace PropFile
