#include <propfile/io/LogicalLineReader.hpp>
#include <propfile/util/escapeUtil.hpp>

namespace PropFile {

std::optional<std::string> LogicalLineReader::readLogicalLine() {
    if (atEnd())
        return std::nullopt;

    std::string line;
    bool escaped = false;
    bool comment = false;
    // 공백 외의 문자를 만나기 전까지는 빈 줄로 간주한다.
    bool blank = true;

    while (pos_ < text_.size()) {
        const char c = text_[pos_++];
        line.push_back(c);

        if (util::isLineBreak(c)) {
            // 주석/빈 줄은 backslash가 있어도 이어지지 않는다.
            if (!escaped || comment || blank) {
                if (c == '\r' && peekIs('\n'))
                    line.push_back(text_[pos_++]);
                break;
            }
            // escape된 개행: CRLF는 한 단위로 이어 붙인다.
            if (c == '\r' && peekIs('\n'))
                line.push_back(text_[pos_++]);
            escaped = false;
            continue;
        }

        if (blank && !escaped) {
            if (c == '#' || c == '!') {
                comment = true;
                blank = false;
            } else if (!util::isWhitespace(c)) {
                // 개행 직전 또는 입력 끝의 backslash는 아직 빈 줄로 본다.
                const bool trailingBackslash =
                    c == '\\' && (atEnd() || util::isLineBreak(text_[pos_]));
                if (!trailingBackslash)
                    blank = false;
            }
        }

        escaped = (c == '\\' && !escaped);
    }

    return line;
}

} // namespace PropFile
