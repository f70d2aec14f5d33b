#include "TextUtils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace TextUtils {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

int64_t parseIntOr(const std::string& str, int64_t defaultValue) {
    std::string value = trim(str);
    if (value.empty()) return defaultValue;

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed, 10);
        if (consumed != value.size()) return defaultValue;
        return static_cast<int64_t>(parsed);
    } catch (const std::exception&) {
        // Not a number or out of range
        return defaultValue;
    }
}

std::string foldCase(const std::string& utf8) {
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(utf8);
    ustr.foldCase();
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

std::string normalizeKey(const std::string& utf8) {
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(utf8);
    ustr.foldCase();

    icu::UnicodeString collapsed;
    bool pendingSpace = false;
    for (int32_t i = 0; i < ustr.length(); ) {
        UChar32 c = ustr.char32At(i);
        i += U16_LENGTH(c);
        if (u_isUWhiteSpace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !collapsed.isEmpty()) {
            collapsed.append(static_cast<UChar>(' '));
        }
        pendingSpace = false;
        collapsed.append(c);
    }

    std::string result;
    collapsed.toUTF8String(result);
    return result;
}

bool containsFolded(const std::string& haystack, const std::string& foldedNeedle) {
    if (foldedNeedle.empty()) return true;
    return foldCase(haystack).find(foldedNeedle) != std::string::npos;
}

bool isValidUtf8(const std::string& bytes) {
    const uint8_t* s = reinterpret_cast<const uint8_t*>(bytes.data());
    int32_t length = static_cast<int32_t>(bytes.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c <= 0) return false;  // Ill-formed sequence or embedded NUL
    }
    return true;
}

bool decodeText(const std::string& bytes, std::string& utf8) {
    utf8.clear();

    if (bytes.size() >= 3 &&
        (uint8_t)bytes[0] == 0xEF && (uint8_t)bytes[1] == 0xBB && (uint8_t)bytes[2] == 0xBF) {
        utf8 = bytes.substr(3);
        return isValidUtf8(utf8);
    }

    if (bytes.size() >= 2) {
        uint8_t b0 = (uint8_t)bytes[0];
        uint8_t b1 = (uint8_t)bytes[1];
        bool littleEndian = (b0 == 0xFF && b1 == 0xFE);
        bool bigEndian = (b0 == 0xFE && b1 == 0xFF);
        if (littleEndian || bigEndian) {
            if (bytes.size() % 2 != 0) return false;

            icu::UnicodeString ustr;
            for (size_t i = 2; i + 1 < bytes.size(); i += 2) {
                uint8_t lo = (uint8_t)bytes[littleEndian ? i : i + 1];
                uint8_t hi = (uint8_t)bytes[littleEndian ? i + 1 : i];
                UChar unit = static_cast<UChar>((hi << 8) | lo);
                if (unit == 0) return false;
                ustr.append(unit);
            }
            ustr.toUTF8String(utf8);
            return true;
        }
    }

    utf8 = bytes;
    return isValidUtf8(utf8);
}

std::string toLowerAscii(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

}
