#include <propfile/util/Charset.hpp>
#include <propfile/util/Errors.hpp>
#include <propfile/util/Utf8.hpp>

#include <cctype>

namespace PropFile {

namespace {

std::string normalizeName(const std::string& name) {
    // 대소문자와 구분자('-', '_')를 무시하고 비교한다.
    std::string n;
    n.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_')
            continue;
        n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return n;
}

void reportReplacements(DiagnosticSink& sink, size_t count, const char* what, Charset charset) {
    if (count == 0)
        return;
    sink.report(Severity::Warning, std::to_string(count) + " " + what + " " + charsetName(charset));
}

std::string decodeUtf8(std::string_view bytes, size_t& bad) {
    // 유효한 입력은 그대로 복사되고, 깨진 시퀀스만 U+FFFD로 교체된다.
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        const size_t start = i;
        char32_t cp = 0;
        if (util::nextCodePoint(bytes, i, cp)) {
            out.append(bytes.data() + start, i - start);
        } else {
            ++bad;
            util::appendUtf8(out, util::kReplacementChar);
        }
    }
    return out;
}

std::string decodeUtf16(std::string_view bytes, bool bigEndian, size_t& bad) {
    std::string out;
    out.reserve(bytes.size());
    auto unitAt = [&](size_t i) -> char32_t {
        const auto b0 = static_cast<unsigned char>(bytes[i]);
        const auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        return bigEndian ? static_cast<char32_t>((b0 << 8) | b1)
                         : static_cast<char32_t>((b1 << 8) | b0);
    };

    size_t i = 0;
    while (i + 1 < bytes.size()) {
        char32_t unit = unitAt(i);
        i += 2;
        if (util::isHighSurrogate(unit)) {
            if (i + 1 < bytes.size() && util::isLowSurrogate(unitAt(i))) {
                const char32_t low = unitAt(i);
                i += 2;
                util::appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                ++bad;
                util::appendUtf8(out, util::kReplacementChar);
            }
        } else if (util::isLowSurrogate(unit)) {
            ++bad;
            util::appendUtf8(out, util::kReplacementChar);
        } else {
            util::appendUtf8(out, unit);
        }
    }
    // 홀수 길이의 마지막 바이트는 온전한 code unit이 아니다.
    if (i < bytes.size()) {
        ++bad;
        util::appendUtf8(out, util::kReplacementChar);
    }
    return out;
}

void appendUtf16Unit(std::string& out, char32_t unit, bool bigEndian) {
    const auto hi = static_cast<char>((unit >> 8) & 0xFF);
    const auto lo = static_cast<char>(unit & 0xFF);
    if (bigEndian) {
        out.push_back(hi);
        out.push_back(lo);
    } else {
        out.push_back(lo);
        out.push_back(hi);
    }
}

std::string encodeUtf16(std::string_view text, bool bigEndian, bool withBom) {
    std::string out;
    out.reserve(text.size() * 2 + 2);
    if (withBom)
        appendUtf16Unit(out, 0xFEFF, bigEndian);

    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = 0;
        util::nextCodePoint(text, i, cp);
        if (cp >= 0x10000) {
            const char32_t v = cp - 0x10000;
            appendUtf16Unit(out, 0xD800 + (v >> 10), bigEndian);
            appendUtf16Unit(out, 0xDC00 + (v & 0x3FF), bigEndian);
        } else {
            appendUtf16Unit(out, cp, bigEndian);
        }
    }
    return out;
}

std::string encodeSingleByte(std::string_view text, char32_t maxCodePoint, size_t& unmappable) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = 0;
        util::nextCodePoint(text, i, cp);
        if (cp <= maxCodePoint) {
            out.push_back(static_cast<char>(cp));
        } else {
            ++unmappable;
            out.push_back('?');
        }
    }
    return out;
}

} // namespace

const char* charsetName(Charset charset) noexcept {
    switch (charset) {
    case Charset::Utf8:
        return "UTF-8";
    case Charset::Utf16:
        return "UTF-16";
    case Charset::Utf16LE:
        return "UTF-16LE";
    case Charset::Utf16BE:
        return "UTF-16BE";
    case Charset::Iso8859_1:
        return "ISO-8859-1";
    case Charset::UsAscii:
        return "US-ASCII";
    }
    return "UNKNOWN";
}

bool isUnicodeCapable(Charset charset) noexcept {
    switch (charset) {
    case Charset::Utf8:
    case Charset::Utf16:
    case Charset::Utf16LE:
    case Charset::Utf16BE:
        return true;
    case Charset::Iso8859_1:
    case Charset::UsAscii:
        return false;
    }
    return false;
}

bool parseCharset(const std::string& name, Charset& out, std::error_code& ec) {
    ec.clear();
    const std::string n = normalizeName(name);

    if (n == "utf8") {
        out = Charset::Utf8;
    } else if (n == "utf16") {
        out = Charset::Utf16;
    } else if (n == "utf16le") {
        out = Charset::Utf16LE;
    } else if (n == "utf16be") {
        out = Charset::Utf16BE;
    } else if (n == "iso88591" || n == "latin1" || n == "iso885911987" || n == "l1") {
        out = Charset::Iso8859_1;
    } else if (n == "usascii" || n == "ascii") {
        out = Charset::UsAscii;
    } else {
        ec = Errc::UnsupportedCharset;
        return false;
    }
    return true;
}

std::string decodeBytes(std::string_view bytes, Charset charset, DiagnosticSink& sink) {
    size_t bad = 0;
    std::string out;

    switch (charset) {
    case Charset::Utf8:
        out = decodeUtf8(bytes, bad);
        break;
    case Charset::Utf16: {
        // BOM이 있으면 그 바이트 순서를 따르고, 없으면 big endian으로 간주한다.
        bool bigEndian = true;
        if (bytes.size() >= 2) {
            const auto b0 = static_cast<unsigned char>(bytes[0]);
            const auto b1 = static_cast<unsigned char>(bytes[1]);
            if (b0 == 0xFE && b1 == 0xFF) {
                bytes.remove_prefix(2);
            } else if (b0 == 0xFF && b1 == 0xFE) {
                bigEndian = false;
                bytes.remove_prefix(2);
            }
        }
        out = decodeUtf16(bytes, bigEndian, bad);
        break;
    }
    case Charset::Utf16LE:
        out = decodeUtf16(bytes, false, bad);
        break;
    case Charset::Utf16BE:
        out = decodeUtf16(bytes, true, bad);
        break;
    case Charset::Iso8859_1:
        out.reserve(bytes.size());
        for (char c : bytes)
            util::appendUtf8(out, static_cast<unsigned char>(c));
        break;
    case Charset::UsAscii:
        out.reserve(bytes.size());
        for (char c : bytes) {
            const auto b = static_cast<unsigned char>(c);
            if (b < 0x80) {
                out.push_back(c);
            } else {
                ++bad;
                util::appendUtf8(out, util::kReplacementChar);
            }
        }
        break;
    }

    reportReplacements(sink, bad, "malformed byte sequence(s) replaced while decoding", charset);
    return out;
}

std::string encodeText(std::string_view text, Charset charset, DiagnosticSink& sink) {
    size_t unmappable = 0;
    std::string out;

    switch (charset) {
    case Charset::Utf8:
        out.assign(text.data(), text.size());
        break;
    case Charset::Utf16:
        out = encodeUtf16(text, true, true);
        break;
    case Charset::Utf16LE:
        out = encodeUtf16(text, false, false);
        break;
    case Charset::Utf16BE:
        out = encodeUtf16(text, true, false);
        break;
    case Charset::Iso8859_1:
        out = encodeSingleByte(text, 0xFF, unmappable);
        break;
    case Charset::UsAscii:
        out = encodeSingleByte(text, 0x7F, unmappable);
        break;
    }

    reportReplacements(sink, unmappable, "character(s) replaced by '?', not representable in", charset);
    return out;
}

} // namespace PropFile
