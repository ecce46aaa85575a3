#include <propfile/util/escapeUtil.hpp>
#include <propfile/util/Utf8.hpp>

namespace PropFile::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// s[i]는 '\\', s[i + 1]은 'u'여야 한다. 4자리 16진수만 허용한다.
bool parseUnicodeUnit(std::string_view s, size_t i, char32_t& unit) {
    if (i + 5 >= s.size())
        return false;
    unit = 0;
    for (size_t k = i + 2; k < i + 6; ++k) {
        const int v = hexValue(s[k]);
        if (v < 0)
            return false;
        unit = (unit << 4) | static_cast<char32_t>(v);
    }
    return true;
}

// \uXXXX 하나(또는 surrogate pair 두 개)를 해석한다.
// 성공하면 소비한 문자 수를 consumed에 담는다.
bool parseUnicodeEscape(std::string_view s, size_t i, char32_t& cp, size_t& consumed) {
    char32_t unit = 0;
    if (!parseUnicodeUnit(s, i, unit))
        return false;

    if (isHighSurrogate(unit)) {
        char32_t low = 0;
        if (i + 7 < s.size() && s[i + 6] == '\\' && s[i + 7] == 'u' &&
            parseUnicodeUnit(s, i + 6, low) && isLowSurrogate(low)) {
            cp = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
            consumed = 12;
            return true;
        }
        // 짝이 없는 surrogate는 UTF-8로 표현할 수 없으므로 잘못된 escape로 취급한다.
        return false;
    }
    if (isLowSurrogate(unit))
        return false;

    cp = unit;
    consumed = 6;
    return true;
}

void reportInvalidUnicode(DiagnosticSink& sink, std::string_view s, size_t i) {
    const std::string_view seq = s.substr(i, 6);
    sink.report(Severity::Error, "Found invalid unicode escape sequence '" + std::string(seq) +
                                     "'. No conversion will be done. The escape sequence "
                                     "should be fixed.");
}

void appendUnicodeEscape(std::string& out, char32_t unit) {
    out += "\\u";
    out.push_back(kHexDigits[(unit >> 12) & 0xF]);
    out.push_back(kHexDigits[(unit >> 8) & 0xF]);
    out.push_back(kHexDigits[(unit >> 4) & 0xF]);
    out.push_back(kHexDigits[unit & 0xF]);
}

void appendEscapedCodePoint(std::string& out, char32_t cp) {
    if (cp >= 0x10000) {
        const char32_t v = cp - 0x10000;
        appendUnicodeEscape(out, 0xD800 + (v >> 10));
        appendUnicodeEscape(out, 0xDC00 + (v & 0x3FF));
    } else {
        appendUnicodeEscape(out, cp);
    }
}

} // namespace

std::string unescape(std::string_view s, DiagnosticSink& sink) {
    std::string out;
    out.reserve(s.size());

    // 실제 개행 직후에만 true가 된다. 이어진 줄의 선행 공백을 버리기 위한 상태.
    bool atLineStart = false;

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];

        if (c == '\\') {
            // 마지막 문자인 backslash는 버린다.
            if (i + 1 == s.size())
                continue;

            const char next = s[i + 1];
            if (next == 'u') {
                char32_t cp = 0;
                size_t consumed = 0;
                if (parseUnicodeEscape(s, i, cp, consumed)) {
                    appendUtf8(out, cp);
                    i += consumed - 1;
                } else {
                    // 잘못된 escape는 그대로 남기고 다음 문자부터 계속 처리한다.
                    reportInvalidUnicode(sink, s, i);
                    out.push_back(c);
                }
                atLineStart = false;
                continue;
            }

            ++i;
            if (next == 'n') {
                out.push_back('\n');
            } else if (next == 'r') {
                out.push_back('\r');
            } else if (isLineBreak(next)) {
                // line continuation: CRLF는 한 단위로 소비한다.
                if (next == '\r' && i + 1 < s.size() && s[i + 1] == '\n')
                    ++i;
                atLineStart = true;
                continue;
            } else {
                // \\ 포함, escape된 문자는 공백이라도 그대로 유지한다.
                out.push_back(next);
            }
            atLineStart = false;
        } else if (isLineBreak(c)) {
            if (c == '\r' && i + 1 < s.size() && s[i + 1] == '\n')
                ++i;
            atLineStart = true;
        } else if (atLineStart && isWhitespace(c)) {
            // 이어진 줄의 선행 공백은 값에 포함되지 않는다.
        } else {
            atLineStart = false;
            out.push_back(c);
        }
    }

    return out;
}

std::string unescapeUnicode(std::string_view s, DiagnosticSink& sink) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c != '\\' || i + 1 == s.size()) {
            out.push_back(c);
            continue;
        }

        const char next = s[i + 1];
        if (next == 'u') {
            char32_t cp = 0;
            size_t consumed = 0;
            if (parseUnicodeEscape(s, i, cp, consumed)) {
                appendUtf8(out, cp);
                i += consumed - 1;
            } else {
                reportInvalidUnicode(sink, s, i);
                out.push_back(c);
            }
        } else if (next == '\\') {
            // "\\\\u00fc"는 유니코드 escape가 아니므로 쌍으로 건너뛴다.
            out.push_back(c);
            out.push_back(next);
            ++i;
        } else {
            out.push_back(c);
        }
    }

    return out;
}

std::string escapeKey(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 4);

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        switch (c) {
        case ' ':
        case '\t':
        case '\f':
        case '=':
        case ':':
        case '\n':
        case '\r':
        case '#':
        case '!':
        case '\\':
            out.push_back('\\');
            break;
        default:
            break;
        }
        out.push_back(c);

        // \r\n의 \n은 다시 escape하지 않는다.
        if (c == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
            out.push_back('\n');
            ++i;
        }
    }

    return out;
}

std::string escapeValue(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 8);

    for (char c : s) {
        switch (c) {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\\':
            out += "\\\\";
            break;
        default:
            out.push_back(c);
            break;
        }
    }

    return out;
}

std::string escapeUnicode(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const auto b = static_cast<unsigned char>(s[i]);
        if (b < 0x80) {
            out.push_back(s[i]);
            ++i;
            continue;
        }
        char32_t cp = 0;
        nextCodePoint(s, i, cp);
        appendEscapedCodePoint(out, cp);
    }

    return out;
}

std::string escapeUnicode(char32_t codepoint) {
    std::string out;
    appendEscapedCodePoint(out, codepoint);
    return out;
}

std::string commentOut(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    out.push_back('#');

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        out.push_back(c);

        if (isLineBreak(c)) {
            if (c == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
                out.push_back('\n');
                ++i;
            }
            // 뒤에 실제 내용이 남아 있을 때만 '#'을 붙인다.
            if (i + 1 < s.size())
                out.push_back('#');
        }
    }

    return out;
}

std::string removeLeadingWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    bool atLineStart = true;
    for (char c : s) {
        if (isLineBreak(c)) {
            out.push_back(c);
            atLineStart = true;
        } else if (atLineStart && isWhitespace(c)) {
            continue;
        } else {
            atLineStart = false;
            out.push_back(c);
        }
    }

    return out;
}

} // namespace PropFile::util
