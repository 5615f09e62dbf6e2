#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trustlock/ca/certificate_authority.hpp>
#include <trustlock/ca/signing_context.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/store/device_registry.hpp>
#include <trustlock/store/revocation_ledger.hpp>
#include <trustlock/verify/validation_pipeline.hpp>
#include <trustlock/whitelist/whitelist_cache.hpp>
#include <trustlock/workflow/registration.hpp>
#include <trustlock/workflow/revocation.hpp>

namespace trustlock {

    /**
     * Device trust subsystem wired together: registry, revocation ledger, CA,
     * whitelist cache, workflows and the validation pipeline.
     *
     * Throws std::invalid_argument when the configuration does not validate.
     */
    class DeviceTrustService {
      public:
        explicit DeviceTrustService(TrustConfig config = {});

        /**
         * Null collaborators fall back to the in-memory stores and the built-in CA.
         *
         * The signed CRL and the published CA certificate come from ca_context. An
         * injected issuer that signs with its own key must be given that key's
         * context here as well; a null issuer issues from ca_context.
         */
        DeviceTrustService(TrustConfig config, std::shared_ptr<DeviceRegistry> registry,
                           std::shared_ptr<RevocationLedger> ledger,
                           std::shared_ptr<ca::CertificateIssuer> issuer = nullptr,
                           std::shared_ptr<ca::CaSigningContext> ca_context = nullptr);

        DeviceTrustService(const DeviceTrustService &) = delete;
        DeviceTrustService &operator=(const DeviceTrustService &) = delete;

        // Registration
        Result<RegistrationOutcome> request_registration(const RegistrationRequest &request);
        Result<ApprovalOutcome> approve_registration(std::string_view device_id, std::string_view approved_by);
        Result<RejectionOutcome> reject_registration(std::string_view device_id, std::string_view rejected_by,
                                                     std::string_view reason);

        // Revocation
        Result<RevocationOutcome> revoke_certificate(std::string_view device_id, std::string_view revoked_by,
                                                     std::string_view reason);
        Result<RevocationOutcome> remove_device(std::string_view device_id, std::string_view removed_by);
        [[nodiscard]] CrlSnapshot get_crl() const;
        Result<SignedCrlExport> export_signed_crl();

        // Validation
        ValidationVerdict validate_device(std::string_view certificate_serial, std::string_view mac_address,
                                          std::string_view device_fingerprint);

        // CA trust anchor
        BoolResult initialize_ca();
        Result<std::string> ca_certificate_pem();

        // Queries
        [[nodiscard]] std::optional<Device> find_device(std::string_view device_id) const;
        [[nodiscard]] std::vector<Device> devices_for_account(std::string_view account_token) const;
        [[nodiscard]] std::vector<Device> pending_registrations() const;
        [[nodiscard]] std::vector<Device> active_devices() const;
        [[nodiscard]] std::size_t pending_count() const;
        [[nodiscard]] std::size_t active_count() const;
        [[nodiscard]] std::size_t revoked_certificate_count() const;
        [[nodiscard]] std::vector<Device> search_devices(std::string_view term) const;
        [[nodiscard]] std::vector<Device> devices_expiring_within(int days) const;

        [[nodiscard]] const TrustConfig &config() const noexcept { return config_; }
        [[nodiscard]] WhitelistCache &whitelist() noexcept { return whitelist_; }

      private:
        static TrustConfig checked(TrustConfig config);

        TrustConfig config_;
        std::shared_ptr<DeviceRegistry> registry_;
        std::shared_ptr<RevocationLedger> ledger_;
        std::shared_ptr<ca::CaSigningContext> ca_context_;
        std::shared_ptr<ca::CertificateIssuer> issuer_;
        WhitelistCache whitelist_;
        RegistrationWorkflow registration_;
        RevocationWorkflow revocation_;
        ValidationPipeline pipeline_;
    };

} // namespace trustlock
