#pragma once
#include <cstdint>
#include <string>
#include <openssl/crypto.h>
#include <openssl/sha.h>

// SHA-256 digests over raw file content. Frame headers never take part.
class HashUtils {
public:
    static constexpr size_t DIGEST_HEX_LENGTH = SHA256_DIGEST_LENGTH * 2;

    static std::string digest(const char* data, size_t len) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data), len, hash);

        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(DIGEST_HEX_LENGTH);
        for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
            result += hex[(hash[i] >> 4) & 0xF];
            result += hex[hash[i] & 0xF];
        }
        return result;
    }

    static std::string digest(const std::string& data) {
        return digest(data.data(), data.size());
    }

    // constant effort once the lengths agree
    static bool verify(const std::string& data, const std::string& expected) {
        if (expected.size() != DIGEST_HEX_LENGTH) return false;
        std::string actual = digest(data);
        return CRYPTO_memcmp(actual.data(), expected.data(), DIGEST_HEX_LENGTH) == 0;
    }

    static bool isDigest(const std::string& text) {
        if (text.size() != DIGEST_HEX_LENGTH) return false;
        for (char c : text) {
            bool lowerHex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!lowerHex) return false;
        }
        return true;
    }
};
