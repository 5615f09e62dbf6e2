#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <trustlock/cert/asn1_writer.hpp>
#include <trustlock/cert/distinguished_name.hpp>
#include <trustlock/cert/key_utils.hpp>
#include <trustlock/cert/oid_registry.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock::cert {

    namespace detail {

        inline constexpr size_t kSerialBytes = 16;

        // 128 random bits; der::encode_integer adds the 0x00 pad that keeps a high first bit positive
        inline Result<std::vector<uint8_t>> make_random_serial() {
            return utils::Common::generate_random_bytes(kSerialBytes);
        }

    } // namespace detail

    struct BuiltCertificate {
        std::vector<uint8_t> der;
        std::vector<uint8_t> tbs_der;
        std::vector<uint8_t> signature;
        std::vector<uint8_t> serial_number;
        DistinguishedName issuer;
        DistinguishedName subject;
        Validity validity;
    };

    class CertificateBuilder {
      public:
        inline CertificateBuilder &set_serial(const std::vector<uint8_t> &serial) {
            serial_number_ = serial;
            return *this;
        }

        inline CertificateBuilder &set_issuer(const DistinguishedName &dn) {
            issuer_ = dn;
            issuer_explicit_ = true;
            return *this;
        }

        inline CertificateBuilder &set_subject(const DistinguishedName &dn) {
            subject_ = dn;
            subject_explicit_ = true;
            return *this;
        }

        inline CertificateBuilder &set_validity(std::chrono::system_clock::time_point not_before,
                                                std::chrono::system_clock::time_point not_after) {
            validity_.not_before = not_before;
            validity_.not_after = not_after;
            return *this;
        }

        inline CertificateBuilder &set_subject_public_key_ed25519(const std::vector<uint8_t> &public_key) {
            subject_public_key_info_.algorithm.signature = SignatureAlgorithmId::Ed25519;
            subject_public_key_info_.public_key = public_key;
            subject_public_key_info_.unused_bits = 0;
            return *this;
        }

        inline CertificateBuilder &add_extension(const RawExtension &extension) {
            auto existing = std::find_if(extensions_.begin(), extensions_.end(),
                                         [&](const RawExtension &ext) { return ext.id == extension.id; });
            if (existing != extensions_.end()) {
                *existing = extension;
            } else {
                extensions_.push_back(extension);
            }
            return *this;
        }

        inline CertificateBuilder &set_basic_constraints(bool is_ca, std::optional<uint32_t> path_length,
                                                         bool critical = true) {
            std::vector<std::vector<uint8_t>> fields;
            if (is_ca) {
                fields.push_back(der::encode_boolean(true));
                if (path_length.has_value()) {
                    fields.push_back(der::encode_integer(static_cast<uint64_t>(path_length.value())));
                }
            }
            return add_extension(make_extension(ExtensionId::BasicConstraints, critical,
                                                der::encode_sequence(der::concat(fields))));
        }

        inline CertificateBuilder &set_key_usage(uint16_t bits, bool critical = true) {
            return add_extension(make_extension(ExtensionId::KeyUsage, critical, der::encode_named_bits(bits)));
        }

        inline CertificateBuilder &set_extended_key_usage(const std::vector<KeyPurposeId> &purposes,
                                                          bool critical = false) {
            std::vector<std::vector<uint8_t>> encoded_oids;
            for (auto purpose : purposes) {
                if (auto oid = oid_for_key_purpose(purpose)) {
                    encoded_oids.push_back(der::encode_oid(*oid));
                }
            }
            if (encoded_oids.empty()) {
                return *this;
            }
            return add_extension(make_extension(ExtensionId::ExtendedKeyUsage, critical,
                                                der::encode_sequence(der::concat(encoded_oids))));
        }

        inline CertificateBuilder &set_subject_key_identifier(const std::vector<uint8_t> &key_id,
                                                              bool critical = false) {
            return add_extension(make_extension(ExtensionId::SubjectKeyIdentifier, critical,
                                                der::encode_octet_string(ByteSpan(key_id.data(), key_id.size()))));
        }

        // AuthorityKeyIdentifier ::= SEQUENCE { keyIdentifier [0] IMPLICIT OCTET STRING }
        inline CertificateBuilder &set_authority_key_identifier(const std::vector<uint8_t> &key_id,
                                                                bool critical = false) {
            auto key_id_field =
                der::encode_tlv(ASN1Class::ContextSpecific, false, 0, ByteSpan(key_id.data(), key_id.size()));
            return add_extension(
                make_extension(ExtensionId::AuthorityKeyIdentifier, critical, der::encode_sequence(key_id_field)));
        }

        inline Result<BuiltCertificate> build(const KeyPair &issuer_key, bool self_signed = false) const {
            if (auto err = validate_inputs(self_signed)) {
                return Result<BuiltCertificate>::failure(
                    Error::crypto_failure(CryptoFailureKind::EncodingFailed, *err));
            }

            BuiltCertificate certificate;
            if (serial_number_.empty()) {
                auto serial = detail::make_random_serial();
                if (!serial.success()) {
                    return Result<BuiltCertificate>::failure(serial.error());
                }
                certificate.serial_number = std::move(serial).value();
            } else {
                certificate.serial_number = serial_number_;
            }
            certificate.issuer = self_signed ? subject_ : issuer_;
            certificate.subject = subject_;
            certificate.validity = validity_;
            certificate.tbs_der = encode_tbs_certificate(certificate.serial_number, certificate.issuer);

            auto sig = sign_ed25519(certificate.tbs_der, issuer_key.private_key);
            if (!sig.success()) {
                return Result<BuiltCertificate>::failure(sig.error());
            }
            certificate.signature = std::move(sig).value();

            std::vector<std::vector<uint8_t>> cert_fields;
            cert_fields.push_back(certificate.tbs_der);
            cert_fields.push_back(encode_algorithm_identifier(signature_algorithm_));
            cert_fields.push_back(
                der::encode_bit_string(ByteSpan(certificate.signature.data(), certificate.signature.size()), 0));
            certificate.der = der::encode_sequence(der::concat(cert_fields));
            return Result<BuiltCertificate>::ok(std::move(certificate));
        }

      private:
        inline std::optional<std::string> validate_inputs(bool self_signed) const {
            if (!subject_explicit_ || subject_.empty()) {
                return "Subject not set";
            }
            if (!issuer_explicit_ && !self_signed) {
                return "Issuer not set";
            }
            if (subject_public_key_info_.public_key.empty()) {
                return "Subject public key not provided";
            }
            if (validity_.not_after <= validity_.not_before) {
                return "Invalid validity range";
            }
            return std::nullopt;
        }

        static inline RawExtension make_extension(ExtensionId id, bool critical, std::vector<uint8_t> value) {
            RawExtension ext{};
            ext.id = id;
            ext.oid = oid_for_extension(id).value_or(Oid{});
            ext.critical = critical;
            ext.value = std::move(value);
            return ext;
        }

        inline std::vector<uint8_t> encode_tbs_certificate(const std::vector<uint8_t> &serial,
                                                           const DistinguishedName &issuer_dn) const {
            std::vector<std::vector<uint8_t>> fields;

            // version [0] EXPLICIT INTEGER, v3 is encoded as 2
            auto version_value = der::encode_integer(static_cast<uint64_t>(2));
            fields.push_back(der::encode_tlv(ASN1Class::ContextSpecific, true, 0,
                                             ByteSpan(version_value.data(), version_value.size())));
            fields.push_back(der::encode_integer(serial));
            fields.push_back(encode_algorithm_identifier(signature_algorithm_));
            fields.push_back(issuer_dn.der());
            fields.push_back(encode_validity(validity_));
            fields.push_back(subject_.der());
            fields.push_back(encode_subject_public_key_info(subject_public_key_info_));

            if (!extensions_.empty()) {
                auto body = encode_extensions(extensions_);
                fields.push_back(
                    der::encode_tlv(ASN1Class::ContextSpecific, true, 3, ByteSpan(body.data(), body.size())));
            }

            return der::encode_sequence(der::concat(fields));
        }

        static inline std::vector<uint8_t> encode_algorithm_identifier(const AlgorithmIdentifier &alg) {
            auto oid = oid_for_signature(alg.signature).value_or(Oid{});
            return der::encode_sequence(der::encode_oid(oid));
        }

        static inline std::vector<uint8_t> encode_validity(const Validity &validity) {
            std::vector<std::vector<uint8_t>> fields;
            fields.push_back(der::serialize_time(validity.not_before));
            fields.push_back(der::serialize_time(validity.not_after));
            return der::encode_sequence(der::concat(fields));
        }

        static inline std::vector<uint8_t> encode_subject_public_key_info(const SubjectPublicKeyInfo &spki) {
            std::vector<std::vector<uint8_t>> fields;
            fields.push_back(encode_algorithm_identifier(spki.algorithm));
            fields.push_back(
                der::encode_bit_string(ByteSpan(spki.public_key.data(), spki.public_key.size()), spki.unused_bits));
            return der::encode_sequence(der::concat(fields));
        }

        static inline std::vector<uint8_t> encode_extensions(const std::vector<RawExtension> &extensions) {
            std::vector<std::vector<uint8_t>> encoded;
            encoded.reserve(extensions.size());
            for (const auto &extension : extensions) {
                std::vector<std::vector<uint8_t>> fields;
                fields.push_back(der::encode_oid(extension.oid));
                if (extension.critical) {
                    fields.push_back(der::encode_boolean(true));
                }
                fields.push_back(
                    der::encode_octet_string(ByteSpan(extension.value.data(), extension.value.size())));
                encoded.push_back(der::encode_sequence(der::concat(fields)));
            }
            return der::encode_sequence(der::concat(encoded));
        }

        std::vector<uint8_t> serial_number_;
        bool issuer_explicit_{false};
        bool subject_explicit_{false};
        DistinguishedName issuer_;
        DistinguishedName subject_;
        Validity validity_{};
        SubjectPublicKeyInfo subject_public_key_info_{};
        AlgorithmIdentifier signature_algorithm_{SignatureAlgorithmId::Ed25519};
        std::vector<RawExtension> extensions_;
    };

} // namespace trustlock::cert
