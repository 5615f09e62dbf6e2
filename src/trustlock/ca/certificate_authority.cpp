#include <trustlock/ca/certificate_authority.hpp>

#include <trustlock/cert/builder.hpp>
#include <trustlock/cert/pem.hpp>
#include <trustlock/core/log.hpp>
#include <trustlock/device/mac_address.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock::ca {

    using cert::DistinguishedNameAttribute;

    namespace {

        constexpr const char *kUnknownDeviceType = "Unknown";

    } // namespace

    std::string format_serial(const std::vector<uint8_t> &serial) {
        return std::string(kSerialPrefix) + utils::to_upper_hex(serial);
    }

    std::optional<std::vector<uint8_t>> parse_serial(std::string_view formatted) {
        if (formatted.substr(0, kSerialPrefix.size()) != kSerialPrefix) {
            return std::nullopt;
        }
        auto hex = formatted.substr(kSerialPrefix.size());
        auto bytes = utils::from_hex(hex);
        if (bytes.empty()) {
            return std::nullopt;
        }
        return bytes;
    }

    std::string certificate_fingerprint(const std::vector<uint8_t> &der) {
        return std::string(kFingerprintPrefix) + utils::to_upper_hex(utils::sha256(der));
    }

    DeviceCertificateAuthority::DeviceCertificateAuthority(std::shared_ptr<CaSigningContext> context,
                                                           TrustConfig config)
        : context_(std::move(context)), config_(std::move(config)) {}

    Result<IssuedCertificate> DeviceCertificateAuthority::issue(const Device &device) {
        auto result = issue_unlogged(device);
        if (!result.success()) {
            const auto &error = result.error();
            log::logger()->critical("certificate issuance failed for {} ({}): {}", device.device_id,
                                    to_string(error.crypto.value_or(CryptoFailureKind::SigningFailed)),
                                    error.message);
        }
        return result;
    }

    Result<IssuedCertificate> DeviceCertificateAuthority::issue_unlogged(const Device &device) {
        using IssueResult = Result<IssuedCertificate>;

        auto material = context_->material();
        if (!material.success()) {
            return IssueResult::failure(material.error());
        }
        const auto &ca = *material.value();

        auto device_keys = cert::generate_ed25519_keypair();
        if (!device_keys.success()) {
            return IssueResult::failure(device_keys.error());
        }
        const auto &keys = device_keys.value();

        auto subject = subject_for(device);
        if (!subject.success) {
            return IssueResult::failure(
                Error::crypto_failure(CryptoFailureKind::EncodingFailed, "device subject: " + subject.error));
        }

        const auto not_before = Clock::now();
        const auto not_after = not_before + std::chrono::hours(24) * config_.certificate_validity_days;

        cert::CertificateBuilder builder;
        builder.set_issuer(ca.issuer)
            .set_subject(subject.value)
            .set_validity(not_before, not_after)
            .set_subject_public_key_ed25519(keys.public_key)
            .set_key_usage(cert::key_usage::DigitalSignature | cert::key_usage::KeyEncipherment)
            .set_extended_key_usage({cert::KeyPurposeId::ClientAuth})
            .set_basic_constraints(false, std::nullopt)
            .set_subject_key_identifier(cert::key_identifier(keys.public_key))
            .set_authority_key_identifier(ca.key_identifier);

        auto built = builder.build(ca.key_pair);
        if (!built.success()) {
            return IssueResult::failure(built.error());
        }
        const auto &certificate = built.value();

        IssuedCertificate issued;
        issued.serial_number = format_serial(certificate.serial_number);
        issued.issued_at = not_before;
        issued.expires_at = not_after;
        issued.fingerprint = certificate_fingerprint(certificate.der);
        issued.key_algorithm = cert::kKeyAlgorithmName;
        issued.signature_algorithm = cert::kSignatureAlgorithmName;
        issued.public_key_base64 = utils::Common::to_base64(keys.public_key);
        issued.certificate_base64 = utils::Common::to_base64(certificate.der);
        issued.certificate_pem = cert::pem_encode("CERTIFICATE", certificate.der);
        issued.subject_dn = certificate.subject.to_string();
        issued.issuer_dn = certificate.issuer.to_string();
        return IssueResult::ok(std::move(issued));
    }

    cert::DistinguishedName::Result DeviceCertificateAuthority::subject_for(const Device &device) const {
        const auto device_type = device.device_type.empty() ? std::string(kUnknownDeviceType) : device.device_type;
        return cert::DistinguishedName::from_attributes({
            {DistinguishedNameAttribute::CommonName, device.device_id},
            {DistinguishedNameAttribute::OrganizationName, config_.device_organization},
            {DistinguishedNameAttribute::OrganizationalUnitName, device_type},
            {DistinguishedNameAttribute::SerialNumber, mac::strip_delimiters(device.mac_address)},
        });
    }

} // namespace trustlock::ca
