#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trustlock/ca/signing_context.hpp>
#include <trustlock/cert/crl_builder.hpp>
#include <trustlock/core/config.hpp>
#include <trustlock/core/result.hpp>
#include <trustlock/device/device.hpp>
#include <trustlock/store/device_registry.hpp>
#include <trustlock/store/revocation_ledger.hpp>
#include <trustlock/whitelist/whitelist_cache.hpp>

namespace trustlock {

    struct RevocationOutcome {
        Device device;
        std::optional<RevocationEntry> entry; // empty when no certificate was bound or on a repeated call
        bool already_applied{false};
        std::string message;
    };

    struct CrlEntrySummary {
        std::string serial_number;
        Timestamp revoked_at{};
        std::string reason;
        RevocationType revocation_type{RevocationType::SecurityConcern};
    };

    struct CrlSnapshot {
        Timestamp generated_at{};
        std::vector<CrlEntrySummary> entries; // newest first
        std::size_t total_revoked{};
        std::string checksum;
    };

    struct SignedCrlExport {
        std::vector<uint8_t> der;
        std::string pem;
        Timestamp this_update{};
        Timestamp next_update{};
        std::size_t entry_count{};
    };

    // Uppercase hex SHA-256 over "serial1|serial2|...|" in list order
    std::string crl_checksum(const std::vector<CrlEntrySummary> &entries);

    cert::CrlReason crl_reason_for(RevocationType type) noexcept;

    class RevocationWorkflow {
      public:
        RevocationWorkflow(DeviceRegistry &registry, RevocationLedger &ledger, WhitelistCache &whitelist,
                           std::shared_ptr<ca::CaSigningContext> ca_context, TrustConfig config);

        // ACTIVE -> REVOKED, ledger entry of type SECURITY_CONCERN
        Result<RevocationOutcome> revoke(std::string_view device_id, std::string_view revoked_by,
                                         std::string_view reason);

        // ACTIVE -> REMOVED, ledger entry of type DEVICE_REMOVED
        Result<RevocationOutcome> remove(std::string_view device_id, std::string_view removed_by);

        [[nodiscard]] CrlSnapshot get_crl() const;

        // X.509 v2 CRL signed with the CA key
        Result<SignedCrlExport> export_signed_crl();

      private:
        Result<RevocationOutcome> retire(std::string_view device_id, std::string_view actor, std::string_view reason,
                                         RevocationType type, DeviceStatus target);

        DeviceRegistry &registry_;
        RevocationLedger &ledger_;
        WhitelistCache &whitelist_;
        std::shared_ptr<ca::CaSigningContext> ca_context_;
        TrustConfig config_;
        std::mutex mutex_;
    };

} // namespace trustlock
