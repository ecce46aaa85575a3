#include <propfile/reformatting/PropertyFormat.hpp>
#include <propfile/util/Errors.hpp>

#include <cctype>

namespace PropFile {

namespace {

bool consumeIgnoreCase(const std::string& s, size_t& pos, const char* token) {
    size_t i = pos;
    for (const char* t = token; *t; ++t, ++i) {
        if (i >= s.size() ||
            std::tolower(static_cast<unsigned char>(s[i])) != static_cast<unsigned char>(*t))
            return false;
    }
    pos = i;
    return true;
}

// " ", "\t", "\f" 중 하나를 읽어 실제 문자로 바꿔 붙인다.
bool consumeWhitespace(const std::string& s, size_t& pos, std::string& out) {
    if (pos < s.size() && s[pos] == ' ') {
        out += ' ';
        ++pos;
        return true;
    }
    if (pos + 1 < s.size() && s[pos] == '\\') {
        if (s[pos + 1] == 't') {
            out += '\t';
            pos += 2;
            return true;
        }
        if (s[pos + 1] == 'f') {
            out += '\f';
            pos += 2;
            return true;
        }
    }
    return false;
}

bool parseLayout(const std::string& s, PropertyFormat& out) {
    size_t pos = 0;
    PropertyFormat fmt;

    while (consumeWhitespace(s, pos, fmt.leadingWhitespace)) {
    }

    if (!consumeIgnoreCase(s, pos, "<key>"))
        return false;

    bool hasSeparatorChar = false;
    for (;;) {
        if (consumeWhitespace(s, pos, fmt.separator))
            continue;
        if (pos < s.size() && (s[pos] == '=' || s[pos] == ':') && !hasSeparatorChar) {
            hasSeparatorChar = true;
            fmt.separator += s[pos++];
            continue;
        }
        break;
    }
    if (fmt.separator.empty())
        return false;

    if (!consumeIgnoreCase(s, pos, "<value>"))
        return false;

    const std::string rest = s.substr(pos);
    if (rest == "\\n")
        fmt.lineEnding = "\n";
    else if (rest == "\\r")
        fmt.lineEnding = "\r";
    else if (rest == "\\r\\n")
        fmt.lineEnding = "\r\n";
    else
        return false;

    out = std::move(fmt);
    return true;
}

} // namespace

bool parseFormat(const std::string& format, PropertyFormat& out, std::error_code& ec,
                 DiagnosticSink& sink) {
    ec.clear();
    if (parseLayout(format, out))
        return true;

    ec = make_error_code(Errc::InvalidFormat);
    sink.report(Severity::Error, "Invalid format string. A usual format is \"<key> = <value>\\n\". "
                                 "The given format was: " +
                                     format);
    return false;
}

} // namespace PropFile
