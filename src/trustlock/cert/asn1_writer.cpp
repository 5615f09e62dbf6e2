#include <trustlock/cert/asn1_writer.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <ctime>

namespace trustlock::cert::der {

    namespace {

        constexpr uint8_t kConstructedBit = 0x20;

        // Short form below 0x80, long form 0x80|n followed by n length octets
        void put_length(std::vector<uint8_t> &out, size_t length) {
            if (length < 0x80U) {
                out.push_back(static_cast<uint8_t>(length));
                return;
            }
            int octets = 0;
            for (size_t rest = length; rest != 0; rest >>= 8U) {
                ++octets;
            }
            out.push_back(static_cast<uint8_t>(0x80U | static_cast<unsigned>(octets)));
            for (int shift = (octets - 1) * 8; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(length >> shift));
            }
        }

        // Seven bits per octet, high bit set on all but the last
        void put_base128(std::vector<uint8_t> &out, uint32_t value) {
            int shift = 28;
            while (shift > 0 && (value >> shift) == 0) {
                shift -= 7;
            }
            for (; shift > 0; shift -= 7) {
                out.push_back(static_cast<uint8_t>(0x80U | ((value >> shift) & 0x7FU)));
            }
            out.push_back(static_cast<uint8_t>(value & 0x7FU));
        }

        std::vector<uint8_t> primitive(ASN1Tag tag, ByteSpan content) {
            return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(tag), content);
        }

    } // namespace

    std::vector<uint8_t> encode_tlv(ASN1Class cls, bool constructed, uint32_t tag, ByteSpan content) {
        std::vector<uint8_t> out;
        out.reserve(content.size() + 6);
        out.push_back(static_cast<uint8_t>(static_cast<uint8_t>(cls) | (constructed ? kConstructedBit : 0U) |
                                           (tag & 0x1FU)));
        put_length(out, content.size());
        out.insert(out.end(), content.begin(), content.end());
        return out;
    }

    std::vector<uint8_t> encode_constructed(ASN1Tag tag, const std::vector<uint8_t> &content) {
        return encode_tlv(ASN1Class::Universal, true, static_cast<uint32_t>(tag), content);
    }

    std::vector<uint8_t> encode_integer(const std::vector<uint8_t> &magnitude) {
        auto first = std::find_if(magnitude.begin(), magnitude.end(), [](uint8_t b) { return b != 0; });
        std::vector<uint8_t> content;
        if (first == magnitude.end() || (*first & 0x80U) != 0) {
            content.push_back(0x00);
        }
        content.insert(content.end(), first, magnitude.end());
        return primitive(ASN1Tag::Integer, content);
    }

    std::vector<uint8_t> encode_integer(uint64_t value) {
        std::vector<uint8_t> magnitude(sizeof(value));
        for (size_t i = 0; i < magnitude.size(); ++i) {
            magnitude[magnitude.size() - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
        }
        return encode_integer(magnitude);
    }

    std::vector<uint8_t> encode_enumerated(uint8_t value) { return primitive(ASN1Tag::Enumerated, ByteSpan(&value, 1)); }

    std::vector<uint8_t> encode_boolean(bool value) {
        const uint8_t octet = value ? 0xFF : 0x00;
        return primitive(ASN1Tag::Boolean, ByteSpan(&octet, 1));
    }

    std::vector<uint8_t> encode_bit_string(ByteSpan bits, uint8_t unused_bits) {
        std::vector<uint8_t> content;
        content.reserve(bits.size() + 1);
        content.push_back(unused_bits);
        content.insert(content.end(), bits.begin(), bits.end());
        return primitive(ASN1Tag::BitString, content);
    }

    std::vector<uint8_t> encode_named_bits(uint16_t bits) {
        const std::array<uint8_t, 2> octets{static_cast<uint8_t>(bits >> 8U), static_cast<uint8_t>(bits)};
        // Trailing zero octets and trailing zero bits are not encoded
        const size_t used = octets[1] != 0 ? 2 : (octets[0] != 0 ? 1 : 0);
        if (used == 0) {
            return encode_bit_string(ByteSpan{}, 0);
        }
        const auto unused = static_cast<uint8_t>(std::countr_zero(octets[used - 1]));
        return encode_bit_string(ByteSpan(octets.data(), used), unused);
    }

    std::vector<uint8_t> encode_octet_string(ByteSpan bytes) { return primitive(ASN1Tag::OctetString, bytes); }

    std::vector<uint8_t> encode_oid(const Oid &oid) {
        std::vector<uint8_t> content;
        if (oid.nodes.size() < 2) {
            content.push_back(0x00);
        } else {
            put_base128(content, oid.nodes[0] * 40U + oid.nodes[1]);
            std::for_each(oid.nodes.begin() + 2, oid.nodes.end(), [&](uint32_t arc) { put_base128(content, arc); });
        }
        return primitive(ASN1Tag::ObjectIdentifier, content);
    }

    std::vector<uint8_t> encode_string(ASN1Tag tag, std::string_view text) {
        return primitive(tag, ByteSpan(reinterpret_cast<const uint8_t *>(text.data()), text.size()));
    }

    std::vector<uint8_t> serialize_time(std::chrono::system_clock::time_point tp) {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        const int year = utc.tm_year + 1900;
        const bool short_year = year >= 1950 && year <= 2049;

        char text[20];
        const size_t written = std::strftime(text, sizeof(text), short_year ? "%y%m%d%H%M%SZ" : "%Y%m%d%H%M%SZ", &utc);
        return encode_string(short_year ? ASN1Tag::UTCTime : ASN1Tag::GeneralizedTime,
                             std::string_view(text, written));
    }

    std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts) {
        std::vector<uint8_t> out;
        for (const auto &part : parts) {
            out.insert(out.end(), part.begin(), part.end());
        }
        return out;
    }

} // namespace trustlock::cert::der
