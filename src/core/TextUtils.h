#pragma once
#include <cstdint>
#include <string>

namespace TextUtils {

std::string trim(const std::string& str);

// Lenient integer parse: absent, empty or non-numeric input gives defaultValue
int64_t parseIntOr(const std::string& str, int64_t defaultValue);

// Unicode case folding (ICU), used for every case-insensitive comparison
std::string foldCase(const std::string& utf8);

// Fold case, collapse whitespace runs to one space and trim
std::string normalizeKey(const std::string& utf8);

// Case-insensitive substring test, needle is expected to be folded already
bool containsFolded(const std::string& haystack, const std::string& foldedNeedle);

bool isValidUtf8(const std::string& bytes);

// Strip a UTF-8 BOM or transcode UTF-16 (LE/BE, with BOM) to UTF-8.
// Returns false if the bytes are not decodable text.
bool decodeText(const std::string& bytes, std::string& utf8);

std::string toLowerAscii(std::string str);

}
