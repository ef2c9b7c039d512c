#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

class HashUtils {
public:

    // rsync style weak checksum: a = sum of bytes, b = sum of (len - i) * byte,
    // both mod 2^16, packed as (b << 16) | a
    static uint32_t computeWeakHash(const char* data, size_t len) {
        uint32_t a = 0;
        uint32_t b = 0;
        for (size_t i = 0; i < len; ++i) {
            uint32_t x = static_cast<unsigned char>(data[i]);
            a += x;
            b += static_cast<uint32_t>(len - i) * x;
        }
        return ((b & 0xFFFF) << 16) | (a & 0xFFFF);
    }

    // slide a window of `len` bytes one byte forward: drop outByte, append inByte
    static uint32_t rollWeakHash(uint32_t hash, char outByte, char inByte, size_t len) {
        uint32_t out = static_cast<unsigned char>(outByte);
        uint32_t in = static_cast<unsigned char>(inByte);

        uint32_t a = hash & 0xFFFF;
        uint32_t b = hash >> 16;
        a = (a - out + in) & 0xFFFF;
        b = (b - static_cast<uint32_t>(len) * out + a) & 0xFFFF;
        return (b << 16) | a;
    }

    static std::string toHex(const std::string& bytes) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            result += hex[(c >> 4) & 0xF];
            result += hex[c & 0xF];
        }
        return result;
    }

};
