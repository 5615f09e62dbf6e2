#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace trustlock {

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    enum class DeviceStatus { PendingApproval, Active, Rejected, Revoked, Removed };

    // PENDING_APPROVAL, ACTIVE, ...
    const char *to_string(DeviceStatus status) noexcept;
    std::optional<DeviceStatus> device_status_from_string(std::string_view name);

    // REJECTED, REVOKED and REMOVED never transition again
    [[nodiscard]] constexpr bool is_terminal(DeviceStatus status) noexcept {
        return status == DeviceStatus::Rejected || status == DeviceStatus::Revoked ||
               status == DeviceStatus::Removed;
    }

    struct CertificateBinding {
        std::string serial;
        std::string fingerprint;
        Timestamp expires_at{};
    };

    struct Device {
        std::string device_id;
        std::string account_token;
        std::string mac_address;
        std::string device_fingerprint;
        std::string device_name;
        std::string device_type;
        std::string os;

        DeviceStatus status{DeviceStatus::PendingApproval};

        // Set once the device reaches ACTIVE, kept afterwards for audit
        std::optional<CertificateBinding> certificate;

        Timestamp requested_at{};
        std::optional<Timestamp> approved_at;
        std::optional<std::string> approved_by;
        std::optional<Timestamp> rejected_at;
        std::optional<std::string> rejected_by;
        std::optional<std::string> rejection_reason;
        std::optional<Timestamp> revoked_at;
        std::optional<std::string> revoked_by;
        std::optional<std::string> revocation_reason;
        std::optional<Timestamp> removed_at;
        std::optional<std::string> removed_by;
        std::optional<Timestamp> last_seen_at;

        [[nodiscard]] bool has_certificate() const noexcept { return certificate.has_value(); }
    };

    enum class RevocationType { SecurityConcern, DeviceRemoved, ExpiredReplaced };

    const char *to_string(RevocationType type) noexcept;

    struct RevocationEntry {
        std::string serial_number;
        std::string device_id;
        std::string account_token;
        Timestamp revoked_at{};
        std::string revoked_by;
        std::string reason;
        RevocationType revocation_type{RevocationType::SecurityConcern};
        std::string certificate_fingerprint;
        Timestamp original_expires_at{};
    };

} // namespace trustlock
