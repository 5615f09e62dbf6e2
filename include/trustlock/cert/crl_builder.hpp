#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <trustlock/cert/asn1_writer.hpp>
#include <trustlock/cert/distinguished_name.hpp>
#include <trustlock/cert/key_utils.hpp>
#include <trustlock/cert/oid_registry.hpp>
#include <trustlock/core/result.hpp>

namespace trustlock::cert {

    // CRLReason (RFC 5280 5.3.1)
    enum class CrlReason : uint8_t {
        Unspecified = 0,
        KeyCompromise = 1,
        CaCompromise = 2,
        AffiliationChanged = 3,
        Superseded = 4,
        CessationOfOperation = 5,
        CertificateHold = 6,
        RemoveFromCrl = 8,
        PrivilegeWithdrawn = 9,
        AaCompromise = 10
    };

    struct RevokedCertificate {
        std::vector<uint8_t> serial_number;
        std::chrono::system_clock::time_point revocation_date{};
        std::optional<CrlReason> reason;
    };

    struct SignedCrl {
        std::vector<uint8_t> der;
        std::vector<uint8_t> tbs_der;
        std::vector<uint8_t> signature;
        DistinguishedName issuer;
        std::chrono::system_clock::time_point this_update{};
        std::optional<std::chrono::system_clock::time_point> next_update;
        std::vector<RevokedCertificate> revoked;
    };

    class CrlBuilder {
      public:
        inline CrlBuilder &set_issuer(const DistinguishedName &dn) {
            issuer_ = dn;
            issuer_set_ = true;
            return *this;
        }

        inline CrlBuilder &set_this_update(std::chrono::system_clock::time_point tp) {
            this_update_ = tp;
            return *this;
        }

        inline CrlBuilder &set_next_update(std::chrono::system_clock::time_point tp) {
            next_update_ = tp;
            return *this;
        }

        inline CrlBuilder &set_authority_key_identifier(const std::vector<uint8_t> &key_id) {
            authority_key_id_ = key_id;
            return *this;
        }

        inline CrlBuilder &add_revoked(const RevokedCertificate &entry) {
            entries_.push_back(entry);
            return *this;
        }

        inline CrlBuilder &add_revoked(std::vector<uint8_t> serial, std::chrono::system_clock::time_point when,
                                       std::optional<CrlReason> reason = std::nullopt) {
            RevokedCertificate entry{};
            entry.serial_number = std::move(serial);
            entry.revocation_date = when;
            entry.reason = reason;
            entries_.push_back(std::move(entry));
            return *this;
        }

        inline Result<SignedCrl> build(const KeyPair &issuer_key) const {
            if (auto err = validate_inputs()) {
                return Result<SignedCrl>::failure(Error::crypto_failure(CryptoFailureKind::EncodingFailed, *err));
            }

            SignedCrl crl{};
            crl.tbs_der = encode_tbs();
            auto sig = sign_ed25519(crl.tbs_der, issuer_key.private_key);
            if (!sig.success()) {
                return Result<SignedCrl>::failure(sig.error());
            }
            crl.signature = std::move(sig).value();
            crl.issuer = issuer_;
            crl.this_update = this_update_;
            crl.next_update = next_update_;
            crl.revoked = entries_;

            std::vector<std::vector<uint8_t>> fields;
            fields.push_back(crl.tbs_der);
            fields.push_back(signature_algorithm());
            fields.push_back(der::encode_bit_string(ByteSpan(crl.signature.data(), crl.signature.size())));
            crl.der = der::encode_sequence(der::concat(fields));
            return Result<SignedCrl>::ok(std::move(crl));
        }

      private:
        inline std::optional<std::string> validate_inputs() const {
            if (!issuer_set_) {
                return "issuer not set";
            }
            if (this_update_ == std::chrono::system_clock::time_point{}) {
                return "thisUpdate not set";
            }
            if (next_update_ && *next_update_ < this_update_) {
                return "nextUpdate precedes thisUpdate";
            }
            for (const auto &entry : entries_) {
                if (entry.serial_number.empty()) {
                    return "revoked entry without serial number";
                }
            }
            return std::nullopt;
        }

        static inline std::vector<uint8_t> signature_algorithm() {
            return der::encode_sequence(der::encode_oid(oid_for_signature(SignatureAlgorithmId::Ed25519).value_or(Oid{})));
        }

        inline std::vector<uint8_t> encode_tbs() const {
            std::vector<std::vector<uint8_t>> fields;

            // v2, encoded as INTEGER 1 and not wrapped in [0] like certificates
            fields.push_back(der::encode_integer(static_cast<uint64_t>(1)));
            fields.push_back(signature_algorithm());
            fields.push_back(issuer_.der());
            fields.push_back(der::serialize_time(this_update_));
            if (next_update_) {
                fields.push_back(der::serialize_time(*next_update_));
            }
            if (!entries_.empty()) {
                fields.push_back(encode_revoked_entries());
            }
            if (!authority_key_id_.empty()) {
                auto extensions = encode_crl_extensions();
                fields.push_back(der::encode_tlv(ASN1Class::ContextSpecific, true, 0,
                                                 ByteSpan(extensions.data(), extensions.size())));
            }
            return der::encode_sequence(der::concat(fields));
        }

        inline std::vector<uint8_t> encode_crl_extensions() const {
            auto key_id = der::encode_tlv(ASN1Class::ContextSpecific, false, 0,
                                          ByteSpan(authority_key_id_.data(), authority_key_id_.size()));
            auto value = der::encode_sequence(key_id);

            std::vector<std::vector<uint8_t>> ext_fields;
            ext_fields.push_back(
                der::encode_oid(oid_for_extension(ExtensionId::AuthorityKeyIdentifier).value_or(Oid{})));
            ext_fields.push_back(der::encode_octet_string(ByteSpan(value.data(), value.size())));
            return der::encode_sequence(der::encode_sequence(der::concat(ext_fields)));
        }

        inline std::vector<uint8_t> encode_revoked_entries() const {
            std::vector<std::vector<uint8_t>> entries;
            for (const auto &revoked : entries_) {
                std::vector<std::vector<uint8_t>> fields;
                fields.push_back(der::encode_integer(revoked.serial_number));
                fields.push_back(der::serialize_time(revoked.revocation_date));

                // crlEntryExtensions ::= SEQUENCE { reasonCode }
                if (revoked.reason) {
                    auto enumerated = der::encode_enumerated(static_cast<uint8_t>(*revoked.reason));
                    auto reason_code = der::concat(
                        {der::encode_oid(oid_for_crl_entry_extension(CrlEntryExtensionId::ReasonCode).value_or(Oid{})),
                         der::encode_octet_string(ByteSpan(enumerated.data(), enumerated.size()))});
                    fields.push_back(der::encode_sequence(der::encode_sequence(reason_code)));
                }
                entries.push_back(der::encode_sequence(der::concat(fields)));
            }
            return der::encode_sequence(der::concat(entries));
        }

        DistinguishedName issuer_;
        bool issuer_set_{false};
        std::chrono::system_clock::time_point this_update_{};
        std::optional<std::chrono::system_clock::time_point> next_update_;
        std::vector<uint8_t> authority_key_id_;
        std::vector<RevokedCertificate> entries_;
    };

} // namespace trustlock::cert
