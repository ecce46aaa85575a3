#pragma once
/// @file ReformatOptions.hpp
/// @brief Options for reformatting and reordering

#include <propfile/Options.hpp>
#include <propfile/reformatting/AttachCommentsTo.hpp>
#include <propfile/util/Charset.hpp>

#include <string>
#include <utility>

namespace PropFile {

/// @brief Immutable reformat/reorder options
///
/// Defaults: UTF-8, UnicodeHandling::ByCharset, format "<key> = <value>\\n",
/// keys and values left as they are, comments attached to the next property.
class ReformatOptions {
  public:
    static constexpr const char* kDefaultFormat = "<key> = <value>\\n";

    ReformatOptions() = default;

    static ReformatOptions create() { return ReformatOptions(); }

    /// @brief Charset for reading and writing files
    ReformatOptions with(Charset charset) const {
        ReformatOptions copy(*this);
        copy.charset_ = charset;
        return copy;
    }

    /// @brief Unicode handling when writing files
    ReformatOptions with(UnicodeHandling unicodeHandling) const {
        ReformatOptions copy(*this);
        copy.unicodeHandling_ = unicodeHandling;
        return copy;
    }

    ReformatOptions with(AttachCommentsTo attachCommentsTo) const {
        ReformatOptions copy(*this);
        copy.attachCommentsTo_ = attachCommentsTo;
        return copy;
    }

    /// @brief Layout applied by reformat(), see parseFormat()
    ReformatOptions withFormat(std::string format) const {
        ReformatOptions copy(*this);
        copy.format_ = std::move(format);
        return copy;
    }

    /// @brief Also normalize keys and values to single-line canonical escaping
    ReformatOptions withReformatKeyAndValue(bool reformatKeyAndValue) const {
        ReformatOptions copy(*this);
        copy.reformatKeyAndValue_ = reformatKeyAndValue;
        return copy;
    }

    Charset charset() const noexcept { return charset_; }
    UnicodeHandling unicodeHandling() const noexcept { return unicodeHandling_; }
    const std::string& format() const noexcept { return format_; }
    bool reformatKeyAndValue() const noexcept { return reformatKeyAndValue_; }
    AttachCommentsTo attachCommentsTo() const noexcept { return attachCommentsTo_; }

    bool operator==(const ReformatOptions& other) const {
        return charset_ == other.charset_ && unicodeHandling_ == other.unicodeHandling_ &&
               format_ == other.format_ && reformatKeyAndValue_ == other.reformatKeyAndValue_ &&
               attachCommentsTo_ == other.attachCommentsTo_;
    }
    bool operator!=(const ReformatOptions& other) const { return !(*this == other); }

    std::string toString() const;

  private:
    Charset charset_ = Charset::Utf8;
    UnicodeHandling unicodeHandling_ = UnicodeHandling::ByCharset;
    std::string format_ = kDefaultFormat;
    bool reformatKeyAndValue_ = false;
    AttachCommentsTo attachCommentsTo_ = AttachCommentsTo::NextProperty;
};

} // namespace PropFile
