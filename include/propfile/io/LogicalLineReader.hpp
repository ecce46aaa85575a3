#pragma once
/// @file LogicalLineReader.hpp
/// @brief Splits decoded text into logical lines

#include <optional>
#include <string>
#include <utility>

namespace PropFile {

/// @brief Yields one logical line per call, line ending included
///
/// A logical line ends at the first unescaped LF, CR or CRLF. A line break
/// preceded by an odd number of backslashes continues the logical line,
/// unless the line is already known to be a comment or blank: those always
/// end at the first line break.
class LogicalLineReader {
  public:
    /// @param text Decoded (UTF-8) document text
    explicit LogicalLineReader(std::string text) : text_(std::move(text)) {}

    /// @brief Read the next logical line
    /// @return The raw line, or std::nullopt at end of input
    std::optional<std::string> readLogicalLine();

    /// @brief Whether all input has been consumed
    bool atEnd() const noexcept { return pos_ >= text_.size(); }

  private:
    bool peekIs(char c) const noexcept { return pos_ < text_.size() && text_[pos_] == c; }

    std::string text_;
    size_t pos_ = 0;
};

} // namespace PropFile
