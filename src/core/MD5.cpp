#include "MD5.h"
#include <algorithm>
#include <cstring>

namespace {

const uint32_t SHIFTS[4][4] = {
    {7, 12, 17, 22},
    {5, 9, 14, 20},
    {4, 11, 16, 23},
    {6, 10, 15, 21}
};

const uint32_t K[64] = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee,
    0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be,
    0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa,
    0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed,
    0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c,
    0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05,
    0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039,
    0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1,
    0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391
};

inline uint32_t rotl(uint32_t x, uint32_t n) {
    return (x << n) | (x >> (32 - n));
}

const char HEX_DIGITS[] = "0123456789abcdef";

} // anonymous namespace

MD5::MD5() : byteCount(0), finished(false) {
    state[0] = 0x67452301;
    state[1] = 0xefcdab89;
    state[2] = 0x98badcfe;
    state[3] = 0x10325476;
    memset(buffer, 0, sizeof(buffer));
}

void MD5::transform(const uint8_t block[64]) {
    uint32_t words[16];
    for (int i = 0; i < 16; i++) {
        words[i] = (uint32_t)block[i * 4] |
                   ((uint32_t)block[i * 4 + 1] << 8) |
                   ((uint32_t)block[i * 4 + 2] << 16) |
                   ((uint32_t)block[i * 4 + 3] << 24);
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];

    for (int i = 0; i < 64; i++) {
        int round = i / 16;
        uint32_t mixed;
        int wordIndex;
        switch (round) {
            case 0:
                mixed = (b & c) | (~b & d);
                wordIndex = i;
                break;
            case 1:
                mixed = (d & b) | (~d & c);
                wordIndex = (5 * i + 1) % 16;
                break;
            case 2:
                mixed = b ^ c ^ d;
                wordIndex = (3 * i + 5) % 16;
                break;
            default:
                mixed = c ^ (b | ~d);
                wordIndex = (7 * i) % 16;
                break;
        }

        uint32_t rotated = rotl(a + mixed + K[i] + words[wordIndex], SHIFTS[round][i % 4]);
        a = d;
        d = c;
        c = b;
        b = b + rotated;
    }

    state[0] += a;
    state[1] += b;
    state[2] += c;
    state[3] += d;
}

void MD5::update(const uint8_t* data, size_t length) {
    if (finished) return;

    size_t used = byteCount % 64;
    byteCount += length;

    size_t offset = 0;
    if (used > 0) {
        size_t take = std::min(length, 64 - used);
        memcpy(buffer + used, data, take);
        offset = take;
        if (used + take < 64) return;
        transform(buffer);
    }

    while (offset + 64 <= length) {
        transform(data + offset);
        offset += 64;
    }

    if (offset < length) {
        memcpy(buffer, data + offset, length - offset);
    }
}

void MD5::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void MD5::updateField(const std::string& field) {
    updateField(static_cast<int64_t>(field.size()));
    update(field);
}

void MD5::updateField(int64_t value) {
    uint8_t bytes[8];
    for (int i = 0; i < 8; i++) {
        bytes[i] = (uint8_t)((uint64_t)value >> (i * 8));
    }
    update(bytes, sizeof(bytes));
}

void MD5::finish() {
    uint64_t bitCount = byteCount * 8;

    uint8_t padding[64] = {0x80};
    size_t used = byteCount % 64;
    size_t padLength = (used < 56) ? (56 - used) : (120 - used);
    update(padding, padLength);

    uint8_t lengthBytes[8];
    for (int i = 0; i < 8; i++) {
        lengthBytes[i] = (uint8_t)(bitCount >> (i * 8));
    }
    update(lengthBytes, sizeof(lengthBytes));

    hex.reserve(32);
    for (int i = 0; i < 4; i++) {
        for (int shift = 0; shift < 32; shift += 8) {
            uint8_t byte = (uint8_t)(state[i] >> shift);
            hex.push_back(HEX_DIGITS[byte >> 4]);
            hex.push_back(HEX_DIGITS[byte & 0x0f]);
        }
    }
    finished = true;
}

std::string MD5::hexdigest() {
    if (!finished) finish();
    return hex;
}

std::string MD5::hash(const std::string& data) {
    MD5 md5;
    md5.update(data);
    return md5.hexdigest();
}
