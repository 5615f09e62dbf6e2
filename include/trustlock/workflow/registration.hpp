#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include <trustlock/ca/certificate_authority.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>
#include <trustlock/store/device_registry.hpp>
#include <trustlock/whitelist/whitelist_cache.hpp>

namespace trustlock {

    struct RegistrationRequest {
        std::string account_token;
        std::string mac_address;
        std::string device_fingerprint;
        std::string device_name;
        std::string device_type;
        std::string os;
    };

    struct RegistrationOutcome {
        Device device;
        std::string message;
    };

    struct ApprovalOutcome {
        Device device;
        ca::IssuedCertificate certificate;
        std::string installation_instructions;
        std::string message;
    };

    struct RejectionOutcome {
        Device device;
        std::string message;
    };

    // Request, approve and reject device registrations
    class RegistrationWorkflow {
      public:
        RegistrationWorkflow(DeviceRegistry &registry, ca::CertificateIssuer &issuer, WhitelistCache &whitelist,
                             TrustConfig config);

        Result<RegistrationOutcome> request_registration(const RegistrationRequest &request);

        // Issues the certificate first; the device becomes ACTIVE only when issuance succeeded
        Result<ApprovalOutcome> approve(std::string_view device_id, std::string_view approved_by);

        Result<RejectionOutcome> reject(std::string_view device_id, std::string_view rejected_by,
                                        std::string_view reason);

      private:
        Result<Device> load_pending(std::string_view device_id) const;
        Result<std::string> generate_device_id() const;

        DeviceRegistry &registry_;
        ca::CertificateIssuer &issuer_;
        WhitelistCache &whitelist_;
        TrustConfig config_;
        std::mutex registration_mutex_; // MAC conflict and account limit checks plus insert
    };

} // namespace trustlock
