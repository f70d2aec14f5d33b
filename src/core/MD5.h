#pragma once
#include <cstdint>
#include <string>

// Incremental MD5, used for chart file hashes and folder fingerprints
class MD5 {
public:
    MD5();

    void update(const uint8_t* data, size_t length);
    void update(const std::string& data);
    // Feeds a length-prefixed string so adjacent fields cannot run together
    void updateField(const std::string& field);
    void updateField(int64_t value);

    // Finishes the digest; further updates are ignored
    std::string hexdigest();

    static std::string hash(const std::string& data);

private:
    void transform(const uint8_t block[64]);
    void finish();

    uint32_t state[4];
    uint64_t byteCount;
    uint8_t buffer[64];
    bool finished;
    std::string hex;
};
