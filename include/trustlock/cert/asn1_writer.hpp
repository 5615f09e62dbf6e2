#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

#include <trustlock/cert/asn1_common.hpp>

namespace trustlock::cert::der {

    // Single-octet identifiers only: every tag trustlock writes is below 31
    std::vector<uint8_t> encode_tlv(ASN1Class cls, bool constructed, uint32_t tag, ByteSpan content);

    std::vector<uint8_t> encode_constructed(ASN1Tag tag, const std::vector<uint8_t> &content);

    inline std::vector<uint8_t> encode_sequence(const std::vector<uint8_t> &content) {
        return encode_constructed(ASN1Tag::Sequence, content);
    }

    // Unsigned big-endian magnitude; leading zeros are dropped and a 0x00 pad keeps a high first bit positive
    std::vector<uint8_t> encode_integer(const std::vector<uint8_t> &magnitude);
    std::vector<uint8_t> encode_integer(uint64_t value);

    std::vector<uint8_t> encode_enumerated(uint8_t value);
    std::vector<uint8_t> encode_boolean(bool value);
    std::vector<uint8_t> encode_bit_string(ByteSpan bits, uint8_t unused_bits = 0);
    std::vector<uint8_t> encode_named_bits(uint16_t bits);
    std::vector<uint8_t> encode_octet_string(ByteSpan bytes);
    std::vector<uint8_t> encode_oid(const Oid &oid);
    std::vector<uint8_t> encode_string(ASN1Tag tag, std::string_view text);

    // UTCTime for 1950-2049, GeneralizedTime otherwise (RFC 5280 4.1.2.5)
    std::vector<uint8_t> serialize_time(std::chrono::system_clock::time_point tp);

    std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts);

} // namespace trustlock::cert::der
