#pragma once
/// @file Options.hpp
/// @brief Write options: charset, unicode handling and missing-key policy

#include <propfile/util/Charset.hpp>

#include <string>

namespace PropFile {

/// @brief How non-ASCII characters are emitted when writing
///
/// Charsets that cannot represent unicode (ISO-8859-1, US-ASCII) always get
/// \\uXXXX escapes, whatever the policy says.
enum class UnicodeHandling {
    DoNothing, ///< Emit the stored text unchanged
    Escape,    ///< Always write \\uXXXX escapes
    Unicode,   ///< Always expand existing \\uXXXX escapes to real characters
    ByCharset  ///< Like Unicode for unicode-capable charsets, otherwise Escape
};

/// @brief What update-in-place does with keys only present in the target file
enum class MissingKeyAction {
    Nothing, ///< Leave them untouched
    Delete,  ///< Remove their lines
    Comment  ///< Comment their lines out
};

const char* toString(UnicodeHandling handling) noexcept;
const char* toString(MissingKeyAction action) noexcept;

/// @brief Immutable write options
///
/// Defaults: UTF-8, MissingKeyAction::Nothing, UnicodeHandling::DoNothing.
/// The with() builders return a modified copy.
///
/// @code
/// auto opts = Options::create().with(Charset::Iso8859_1).with(MissingKeyAction::Delete);
/// @endcode
class Options {
  public:
    Options() = default;

    Options(Charset charset, MissingKeyAction missingKeyAction, UnicodeHandling unicodeHandling)
        : charset_(charset), missingKeyAction_(missingKeyAction),
          unicodeHandling_(unicodeHandling) {}

    static Options create() { return Options(); }

    Options with(Charset charset) const {
        return Options(charset, missingKeyAction_, unicodeHandling_);
    }
    Options with(MissingKeyAction missingKeyAction) const {
        return Options(charset_, missingKeyAction, unicodeHandling_);
    }
    Options with(UnicodeHandling unicodeHandling) const {
        return Options(charset_, missingKeyAction_, unicodeHandling);
    }

    Charset charset() const noexcept { return charset_; }
    MissingKeyAction missingKeyAction() const noexcept { return missingKeyAction_; }
    UnicodeHandling unicodeHandling() const noexcept { return unicodeHandling_; }

    bool operator==(const Options& other) const noexcept {
        return charset_ == other.charset_ && missingKeyAction_ == other.missingKeyAction_ &&
               unicodeHandling_ == other.unicodeHandling_;
    }
    bool operator!=(const Options& other) const noexcept { return !(*this == other); }

    std::string toString() const;

  private:
    Charset charset_ = Charset::Utf8;
    MissingKeyAction missingKeyAction_ = MissingKeyAction::Nothing;
    UnicodeHandling unicodeHandling_ = UnicodeHandling::DoNothing;
};

} // namespace PropFile
