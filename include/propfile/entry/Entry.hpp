#pragma once
/// @file Entry.hpp
/// @brief The two kinds of entries a .properties document is made of

#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace PropFile {

/// @brief A comment or blank line, stored verbatim with its line ending
class BasicEntry {
  public:
    BasicEntry() = default;

    /// @param text Raw line text including its line ending
    explicit BasicEntry(std::string text) : text_(std::move(text)) {}

    /// @brief The exact characters of this entry
    const std::string& toText() const noexcept { return text_; }

    bool operator==(const BasicEntry& other) const { return text_ == other.text_; }
    bool operator!=(const BasicEntry& other) const { return !(*this == other); }

  private:
    std::string text_;
};

/// @brief A key/value line
///
/// All five fields hold escaped text exactly as it appears in the file.
/// Concatenated, they reproduce the original characters of the entry.
class PropertyEntry {
  public:
    PropertyEntry() = default;

    /// @brief Entry with default formatting: ("", key, " = ", value, "\n")
    /// @param key Escaped key
    /// @param value Escaped value
    PropertyEntry(std::string key, std::string value)
        : PropertyEntry("", std::move(key), " = ", std::move(value), "\n") {}

    PropertyEntry(std::string leadingWhitespace, std::string key, std::string separator,
                  std::string value, std::string lineEnding)
        : leadingWhitespace_(std::move(leadingWhitespace)), key_(std::move(key)),
          separator_(std::move(separator)), value_(std::move(value)),
          lineEnding_(std::move(lineEnding)) {}

    const std::string& leadingWhitespace() const noexcept { return leadingWhitespace_; }
    const std::string& key() const noexcept { return key_; }
    const std::string& separator() const noexcept { return separator_; }
    const std::string& value() const noexcept { return value_; }
    const std::string& lineEnding() const noexcept { return lineEnding_; }

    void setLeadingWhitespace(std::string s) { leadingWhitespace_ = std::move(s); }
    void setKey(std::string s) { key_ = std::move(s); }
    void setSeparator(std::string s) { separator_ = std::move(s); }
    void setValue(std::string s) { value_ = std::move(s); }
    void setLineEnding(std::string s) { lineEnding_ = std::move(s); }

    /// @brief The exact characters of this entry (all fields concatenated)
    std::string toText() const {
        std::string out;
        out.reserve(leadingWhitespace_.size() + key_.size() + separator_.size() + value_.size() +
                    lineEnding_.size());
        out += leadingWhitespace_;
        out += key_;
        out += separator_;
        out += value_;
        out += lineEnding_;
        return out;
    }

    bool operator==(const PropertyEntry& other) const {
        return leadingWhitespace_ == other.leadingWhitespace_ && key_ == other.key_ &&
               separator_ == other.separator_ && value_ == other.value_ &&
               lineEnding_ == other.lineEnding_;
    }
    bool operator!=(const PropertyEntry& other) const { return !(*this == other); }

  private:
    std::string leadingWhitespace_;
    std::string key_;
    std::string separator_;
    std::string value_;
    std::string lineEnding_;
};

/// @brief One parsed unit of a document
using Entry = std::variant<BasicEntry, PropertyEntry>;

/// @brief The exact characters of any entry
inline std::string toText(const Entry& entry) {
    return std::visit([](const auto& e) { return std::string(e.toText()); }, entry);
}

inline bool isPropertyEntry(const Entry& entry) noexcept {
    return std::holds_alternative<PropertyEntry>(entry);
}

inline std::ostream& operator<<(std::ostream& os, const BasicEntry& e) {
    return os << "BasicEntry{\"" << e.toText() << "\"}";
}

inline std::ostream& operator<<(std::ostream& os, const PropertyEntry& e) {
    return os << "PropertyEntry{\"" << e.leadingWhitespace() << "\", \"" << e.key() << "\", \""
              << e.separator() << "\", \"" << e.value() << "\", \"" << e.lineEnding() << "\"}";
}

} // namespace PropFile
