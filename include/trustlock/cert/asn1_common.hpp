#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace trustlock::cert {

    using ByteSpan = std::span<const uint8_t>;

    enum class ASN1Class : uint8_t { Universal = 0x00, Application = 0x40, ContextSpecific = 0x80, Private = 0xC0 };

    enum class ASN1Tag : uint8_t {
        Boolean = 0x01,
        Integer = 0x02,
        BitString = 0x03,
        OctetString = 0x04,
        Null = 0x05,
        ObjectIdentifier = 0x06,
        Enumerated = 0x0A,
        UTF8String = 0x0C,
        Sequence = 0x10,
        Set = 0x11,
        PrintableString = 0x13,
        IA5String = 0x16,
        UTCTime = 0x17,
        GeneralizedTime = 0x18
    };

    enum class SignatureAlgorithmId { Unknown = 0, Ed25519 };

    enum class ExtensionId {
        Unknown = 0,
        BasicConstraints,
        KeyUsage,
        ExtendedKeyUsage,
        AuthorityKeyIdentifier,
        SubjectKeyIdentifier
    };

    enum class KeyPurposeId { Unknown = 0, ServerAuth, ClientAuth };

    // CRL entry extensions (inside a revoked certificate entry)
    enum class CrlEntryExtensionId { Unknown = 0, ReasonCode };

    struct Oid {
        std::vector<uint32_t> nodes;

        friend bool operator==(const Oid &, const Oid &) = default;
    };

    struct AlgorithmIdentifier {
        SignatureAlgorithmId signature{SignatureAlgorithmId::Ed25519};
    };

    struct SubjectPublicKeyInfo {
        AlgorithmIdentifier algorithm{};
        std::vector<uint8_t> public_key;
        uint8_t unused_bits{};
    };

    struct RawExtension {
        Oid oid{};
        ExtensionId id{ExtensionId::Unknown};
        bool critical{};
        std::vector<uint8_t> value;
    };

    struct Validity {
        std::chrono::system_clock::time_point not_before{};
        std::chrono::system_clock::time_point not_after{};

        [[nodiscard]] bool contains(std::chrono::system_clock::time_point time) const noexcept {
            return time >= not_before && time <= not_after;
        }
    };

    // KeyUsage named bits, first octet most significant (RFC 5280 4.2.1.3)
    namespace key_usage {
        constexpr uint16_t DigitalSignature = 0x8000;
        constexpr uint16_t NonRepudiation = 0x4000;
        constexpr uint16_t KeyEncipherment = 0x2000;
        constexpr uint16_t DataEncipherment = 0x1000;
        constexpr uint16_t KeyAgreement = 0x0800;
        constexpr uint16_t KeyCertSign = 0x0400;
        constexpr uint16_t CRLSign = 0x0200;
    } // namespace key_usage

} // namespace trustlock::cert
