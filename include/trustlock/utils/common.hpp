#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <sodium.h>

#include "trustlock/core/result.hpp"
#include "trustlock/utils/sodium_utils.hpp"

namespace trustlock::utils {

    class Common {
      public:
        static constexpr size_t SHA256_DIGEST_SIZE = crypto_hash_sha256_BYTES;

        static Result<std::vector<uint8_t>> generate_random_bytes(size_t size);

        static std::vector<uint8_t> sha256(const uint8_t *data, size_t size);

        static std::string bytes_to_hex(const std::vector<uint8_t> &data, bool uppercase = false);
        static std::vector<uint8_t> hex_to_bytes(std::string_view hex);

        static std::string to_base64(const std::vector<uint8_t> &data);

        static std::string to_upper(std::string_view text);
        static bool iequals(std::string_view a, std::string_view b);
        static bool icontains(std::string_view haystack, std::string_view needle);

      private:
        static uint8_t hex_char_to_byte(char c);
        static char byte_to_hex_char(uint8_t b, bool uppercase);
    };

    inline std::string to_hex(const std::vector<uint8_t> &data) { return Common::bytes_to_hex(data); }

    inline std::string to_upper_hex(const std::vector<uint8_t> &data) { return Common::bytes_to_hex(data, true); }

    inline std::vector<uint8_t> from_hex(std::string_view hex) { return Common::hex_to_bytes(hex); }

    inline std::vector<uint8_t> sha256(const std::vector<uint8_t> &data) {
        return Common::sha256(data.data(), data.size());
    }

    inline std::vector<uint8_t> sha256(std::string_view text) {
        return Common::sha256(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }

} // namespace trustlock::utils
