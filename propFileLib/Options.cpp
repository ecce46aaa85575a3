#include <propfile/Options.hpp>

namespace PropFile {

const char* toString(UnicodeHandling handling) noexcept {
    switch (handling) {
    case UnicodeHandling::DoNothing:
        return "DO_NOTHING";
    case UnicodeHandling::Escape:
        return "ESCAPE";
    case UnicodeHandling::Unicode:
        return "UNICODE";
    case UnicodeHandling::ByCharset:
        return "BY_CHARSET";
    }
    return "UNKNOWN";
}

const char* toString(MissingKeyAction action) noexcept {
    switch (action) {
    case MissingKeyAction::Nothing:
        return "NOTHING";
    case MissingKeyAction::Delete:
        return "DELETE";
    case MissingKeyAction::Comment:
        return "COMMENT";
    }
    return "UNKNOWN";
}

std::string Options::toString() const {
    return std::string("Options{charset=") + charsetName(charset_) +
           ", missingKeyAction=" + PropFile::toString(missingKeyAction_) +
           ", unicodeHandling=" + PropFile::toString(unicodeHandling_) + "}";
}

} // namespace PropFile
