#include <propfile/io/EntryParser.hpp>
#include <propfile/util/escapeUtil.hpp>

namespace PropFile {

namespace {

bool isSpaceOrBreak(char c) { return util::isWhitespace(c) || util::isLineBreak(c); }

bool isKeyTerminator(char c) { return isSpaceOrBreak(c) || c == '=' || c == ':'; }

} // namespace

Entry EntryParser::parse(std::string_view logicalLine) {
    if (isComment(logicalLine) || isBlank(logicalLine))
        return BasicEntry(std::string(logicalLine));

    // 각 구간은 앞 구간이 끝난 위치에서 시작한다. 모두 escape된 원문 그대로 보관한다.
    const std::string_view leading = parseLeadingWhitespace(logicalLine);
    const std::string_view key = parseKey(logicalLine, leading.size());
    const std::string_view separator = parseSeparator(logicalLine, leading.size() + key.size());
    const std::string_view valueWithLineEnding =
        parseValue(logicalLine, leading.size() + key.size() + separator.size());

    std::string_view value;
    std::string_view lineEnding;
    splitValueAndLineEnding(valueWithLineEnding, value, lineEnding);

    return PropertyEntry(std::string(leading), std::string(key), std::string(separator),
                         std::string(value), std::string(lineEnding));
}

bool EntryParser::isComment(std::string_view logicalLine) {
    for (char c : logicalLine) {
        if (isSpaceOrBreak(c))
            continue;
        return c == '#' || c == '!';
    }
    return false;
}

bool EntryParser::isBlank(std::string_view logicalLine) {
    for (size_t i = 0; i < logicalLine.size(); ++i) {
        const char c = logicalLine[i];
        if (isSpaceOrBreak(c))
            continue;
        // 개행 앞의 backslash는 continuation 표시일 뿐 내용이 아니다.
        return c == '\\' && i + 1 < logicalLine.size() && util::isLineBreak(logicalLine[i + 1]);
    }
    return true;
}

std::string_view EntryParser::parseLeadingWhitespace(std::string_view logicalLine) {
    for (size_t i = 0; i < logicalLine.size(); ++i) {
        const char c = logicalLine[i];
        // 키가 없으면 앞의 공백은 separator에 속한다.
        if (c == '=' || c == ':')
            return logicalLine.substr(0, 0);
        if (!isSpaceOrBreak(c))
            return logicalLine.substr(0, i);
    }
    return logicalLine;
}

std::string_view EntryParser::parseKey(std::string_view logicalLine, size_t startAt) {
    // 이어진 줄의 시작에서는 공백을 건너뛴다.
    bool ignoreWhitespace = false;
    // escape된 문자 바로 뒤 위치. 다음이 구분자면 키는 여기서 끝난다.
    size_t keyEndCandidate = std::string_view::npos;

    for (size_t i = startAt; i < logicalLine.size(); ++i) {
        const char c = logicalLine[i];

        if (ignoreWhitespace && util::isWhitespace(c))
            continue;

        if (c == '\\' && i + 1 < logicalLine.size()) {
            // backslash 다음 문자는 무조건 키의 일부다. escape된 CRLF는 한 단위로 본다.
            const char next = logicalLine[++i];
            if (util::isLineBreak(next)) {
                ignoreWhitespace = true;
                if (next == '\r' && i + 1 < logicalLine.size() && logicalLine[i + 1] == '\n')
                    ++i;
            }
            keyEndCandidate = i + 1;
        } else if (isKeyTerminator(c)) {
            const size_t end = keyEndCandidate != std::string_view::npos ? keyEndCandidate : i;
            return logicalLine.substr(startAt, end - startAt);
        } else {
            ignoreWhitespace = false;
            keyEndCandidate = std::string_view::npos;
        }
    }

    return logicalLine.substr(startAt);
}

std::string_view EntryParser::parseSeparator(std::string_view logicalLine, size_t startAt) {
    bool separatorCharSeen = false;

    for (size_t i = startAt; i < logicalLine.size(); ++i) {
        const char c = logicalLine[i];
        if (c == '=' || c == ':') {
            // 두 번째 '='/':'는 값의 일부다.
            if (separatorCharSeen)
                return logicalLine.substr(startAt, i - startAt);
            separatorCharSeen = true;
            continue;
        }
        if (!util::isWhitespace(c))
            return logicalLine.substr(startAt, i - startAt);
    }

    return logicalLine.substr(startAt);
}

std::string_view EntryParser::parseValue(std::string_view logicalLine, size_t startAt) {
    size_t i = startAt;
    while (i < logicalLine.size() && util::isWhitespace(logicalLine[i]))
        ++i;
    return logicalLine.substr(i);
}

void EntryParser::splitValueAndLineEnding(std::string_view valueWithLineEnding,
                                          std::string_view& value, std::string_view& lineEnding) {
    size_t end = valueWithLineEnding.size();
    while (end > 0 && util::isLineBreak(valueWithLineEnding[end - 1]))
        --end;

    value = valueWithLineEnding.substr(0, end);
    lineEnding = valueWithLineEnding.substr(end);
    if (lineEnding.empty())
        lineEnding = "\n";
}

} // namespace PropFile
