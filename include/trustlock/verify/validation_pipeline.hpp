#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <trustlock/store/device_registry.hpp>
#include <trustlock/store/revocation_ledger.hpp>
#include <trustlock/whitelist/whitelist_cache.hpp>

namespace trustlock {

    struct Valid {
        std::string device_id;
        std::string account_token;
    };

    struct Invalid {
        std::string reason;
        bool security_alert{false};
    };

    // Expected outcome of an authentication attempt, not an error
    using ValidationVerdict = std::variant<Valid, Invalid>;

    [[nodiscard]] inline bool is_valid(const ValidationVerdict &verdict) noexcept {
        return std::holds_alternative<Valid>(verdict);
    }

    [[nodiscard]] inline bool is_security_alert(const ValidationVerdict &verdict) noexcept {
        const auto *invalid = std::get_if<Invalid>(&verdict);
        return invalid != nullptr && invalid->security_alert;
    }

    // Empty for a Valid verdict
    [[nodiscard]] inline std::string reason_of(const ValidationVerdict &verdict) {
        const auto *invalid = std::get_if<Invalid>(&verdict);
        return invalid != nullptr ? invalid->reason : std::string{};
    }

    namespace reasons {
        inline constexpr const char *kRevoked = "certificate revoked";
        inline constexpr const char *kNotRecognized = "certificate not recognized";
        inline constexpr const char *kIdentifierMismatch = "device identifier mismatch";
        inline constexpr const char *kNotAuthorized = "device not authorized";
        inline constexpr const char *kVerificationFailed = "device verification failed";
        inline constexpr const char *kExpired = "certificate expired";
        inline constexpr const char *kNotActivePrefix = "device is not active: ";
    } // namespace reasons

    struct ValidationRequest {
        std::string certificate_serial;
        std::string mac_address;
        std::string device_fingerprint;
    };

    /**
     * Request-time device authentication.
     *
     * Checks run in a fixed order and the first failure decides the verdict:
     * revocation, certificate lookup, MAC binding, whitelist, fingerprint,
     * expiry, status. A MAC or fingerprint mismatch is flagged as a security
     * alert. Success stamps last_seen_at on the device.
     */
    class ValidationPipeline {
      public:
        ValidationPipeline(const RevocationLedger &ledger, DeviceRegistry &registry, WhitelistCache &whitelist);

        ValidationVerdict validate(const ValidationRequest &request);

      private:
        ValidationVerdict evaluate(const ValidationRequest &request);

        const RevocationLedger &ledger_;
        DeviceRegistry &registry_;
        WhitelistCache &whitelist_;
    };

} // namespace trustlock
