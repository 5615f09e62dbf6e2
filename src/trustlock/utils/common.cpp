#include "trustlock/utils/common.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace trustlock::utils {

    Result<std::vector<uint8_t>> Common::generate_random_bytes(size_t size) {
        using BytesResult = Result<std::vector<uint8_t>>;
        auto ready = require_sodium("random generation");
        if (!ready.success()) {
            return BytesResult::failure(ready.error());
        }
        std::vector<uint8_t> bytes(size);
        randombytes_buf(bytes.data(), bytes.size());
        return BytesResult::ok(std::move(bytes));
    }

    // SHA-256 and base64 do not depend on sodium_init
    std::vector<uint8_t> Common::sha256(const uint8_t *data, size_t size) {
        std::vector<uint8_t> digest(SHA256_DIGEST_SIZE);
        crypto_hash_sha256(digest.data(), data, static_cast<unsigned long long>(size));
        return digest;
    }

    std::string Common::bytes_to_hex(const std::vector<uint8_t> &data, bool uppercase) {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            hex.push_back(byte_to_hex_char((byte >> 4) & 0x0F, uppercase));
            hex.push_back(byte_to_hex_char(byte & 0x0F, uppercase));
        }
        return hex;
    }

    std::vector<uint8_t> Common::hex_to_bytes(std::string_view hex) {
        if (hex.size() % 2 != 0) {
            return {}; // Invalid: odd-length hex string
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);
        try {
            for (size_t i = 0; i < hex.size(); i += 2) {
                uint8_t byte = static_cast<uint8_t>((hex_char_to_byte(hex[i]) << 4) | hex_char_to_byte(hex[i + 1]));
                bytes.push_back(byte);
            }
        } catch (const std::invalid_argument &) {
            return {};
        }
        return bytes;
    }

    std::string Common::to_base64(const std::vector<uint8_t> &data) {
        constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
        std::string encoded(sodium_base64_encoded_len(data.size(), variant), '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
        // sodium_base64_encoded_len counts the trailing NUL
        encoded.resize(encoded.size() - 1);
        return encoded;
    }

    std::string Common::to_upper(std::string_view text) {
        std::string upper(text);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }

    bool Common::iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    bool Common::icontains(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }
        return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
    }

    uint8_t Common::hex_char_to_byte(char c) {
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F')
            return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument("Invalid hex character");
    }

    char Common::byte_to_hex_char(uint8_t b, bool uppercase) {
        if (b < 10) {
            return static_cast<char>('0' + b);
        }
        return static_cast<char>((uppercase ? 'A' : 'a') + b - 10);
    }

} // namespace trustlock::utils
