#pragma once
/// @file Utf8.hpp
/// @brief Minimal UTF-8 code point helpers used by the codecs

#include <string>
#include <string_view>

namespace PropFile::util {

constexpr char32_t kReplacementChar = 0xFFFD;

inline bool isSurrogate(char32_t cp) { return cp >= 0xD800 && cp <= 0xDFFF; }
inline bool isHighSurrogate(char32_t cp) { return cp >= 0xD800 && cp <= 0xDBFF; }
inline bool isLowSurrogate(char32_t cp) { return cp >= 0xDC00 && cp <= 0xDFFF; }

/// @brief Append a code point in UTF-8 encoding
/// @note Surrogates and values above U+10FFFF are written as U+FFFD
inline void appendUtf8(std::string& out, char32_t cp) {
    if (isSurrogate(cp) || cp > 0x10FFFF)
        cp = kReplacementChar;

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// @brief Decode the code point starting at s[i] and advance i past it
/// @param s UTF-8 text
/// @param i Byte offset, advanced by at least one byte
/// @param cp Decoded code point (U+FFFD when malformed)
/// @return false if the sequence at s[i] was malformed
inline bool nextCodePoint(std::string_view s, size_t& i, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        ++i;
        return true;
    }

    size_t len = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        cp = b0 & 0x1F;
        min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        cp = b0 & 0x0F;
        min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        cp = b0 & 0x07;
        min = 0x10000;
    } else {
        cp = kReplacementChar;
        ++i;
        return false;
    }

    if (i + len > s.size()) {
        cp = kReplacementChar;
        ++i;
        return false;
    }
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            cp = kReplacementChar;
            ++i;
            return false;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || isSurrogate(cp)) {
        cp = kReplacementChar;
        ++i;
        return false;
    }
    i += len;
    return true;
}

} // namespace PropFile::util
