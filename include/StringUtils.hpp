#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

/**
 * Lowercase copy of a string (ASCII only)
 */
inline std::string toLower(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * Trim whitespace from both ends of a string
 */
inline std::string trim(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";  // String is all whitespace
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return std::string{str.substr(start, end - start + 1)};
}

/**
 * Decode UTF-8 into code points
 *
 * A byte that does not start a well-formed sequence (stray continuation,
 * overlong form, surrogate, truncated tail) decodes to its own byte value.
 *
 * @param str UTF-8 text
 * @return One code point per character
 */
inline std::vector<uint32_t> decodeUtf8(std::string_view str) {
    std::vector<uint32_t> out;
    out.reserve(str.size());

    auto byteAt = [&](size_t i) { return static_cast<unsigned char>(str[i]); };
    auto isCont = [](unsigned char c) { return (c & 0xC0) == 0x80; };

    size_t i = 0;
    while (i < str.size()) {
        const unsigned char b0 = byteAt(i);
        size_t len = 0;
        uint32_t cp = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // allowed range of the second byte

        if (b0 < 0x80) {
            out.push_back(b0);
            ++i;
            continue;
        } else if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2; cp = b0 & 0x1F;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3; cp = b0 & 0x0F;
            if (b0 == 0xE0) lo = 0xA0;        // overlong
            if (b0 == 0xED) hi = 0x9F;        // surrogates
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4; cp = b0 & 0x07;
            if (b0 == 0xF0) lo = 0x90;        // overlong
            if (b0 == 0xF4) hi = 0x8F;        // above U+10FFFF
        }

        bool valid = len > 0 && i + len <= str.size()
                  && byteAt(i + 1) >= lo && byteAt(i + 1) <= hi;
        for (size_t k = 2; valid && k < len; ++k) {
            valid = isCont(byteAt(i + k));
        }

        if (!valid) {
            out.push_back(b0);
            ++i;
            continue;
        }

        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (byteAt(i + k) & 0x3F);
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

} // namespace utils

#endif // STRING_UTILS_HPP
