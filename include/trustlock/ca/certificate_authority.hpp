#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trustlock/ca/signing_context.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>

namespace trustlock::ca {

    inline constexpr std::string_view kSerialPrefix = "CERT-";
    inline constexpr std::string_view kFingerprintPrefix = "SHA256:";

    // "CERT-" followed by the serial as uppercase hex
    std::string format_serial(const std::vector<uint8_t> &serial);
    std::optional<std::vector<uint8_t>> parse_serial(std::string_view formatted);

    // "SHA256:" followed by uppercase hex of the digest
    std::string certificate_fingerprint(const std::vector<uint8_t> &der);

    struct IssuedCertificate {
        std::string serial_number;
        Timestamp issued_at{};
        Timestamp expires_at{};
        std::string fingerprint;
        std::string key_algorithm;
        std::string signature_algorithm;
        std::string public_key_base64;
        std::string certificate_base64;
        std::string certificate_pem;
        std::string subject_dn;
        std::string issuer_dn;
    };

    // Issues device certificates. Failures are CryptoFailure errors.
    class CertificateIssuer {
      public:
        virtual ~CertificateIssuer() = default;

        virtual Result<IssuedCertificate> issue(const Device &device) = 0;
    };

    class DeviceCertificateAuthority : public CertificateIssuer {
      public:
        DeviceCertificateAuthority(std::shared_ptr<CaSigningContext> context, TrustConfig config);

        Result<IssuedCertificate> issue(const Device &device) override;

        [[nodiscard]] const std::shared_ptr<CaSigningContext> &context() const noexcept { return context_; }

      private:
        Result<IssuedCertificate> issue_unlogged(const Device &device);
        cert::DistinguishedName::Result subject_for(const Device &device) const;

        std::shared_ptr<CaSigningContext> context_;
        TrustConfig config_;
    };

} // namespace trustlock::ca
