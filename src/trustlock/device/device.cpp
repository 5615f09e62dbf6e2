#include <trustlock/device/device.hpp>

#include <array>
#include <utility>

namespace trustlock {

    namespace {

        constexpr std::array<std::pair<DeviceStatus, const char *>, 5> kStatusNames{{
            {DeviceStatus::PendingApproval, "PENDING_APPROVAL"},
            {DeviceStatus::Active, "ACTIVE"},
            {DeviceStatus::Rejected, "REJECTED"},
            {DeviceStatus::Revoked, "REVOKED"},
            {DeviceStatus::Removed, "REMOVED"},
        }};

    } // namespace

    const char *to_string(DeviceStatus status) noexcept {
        for (const auto &[value, name] : kStatusNames) {
            if (value == status) {
                return name;
            }
        }
        return "UNKNOWN";
    }

    std::optional<DeviceStatus> device_status_from_string(std::string_view name) {
        for (const auto &[value, text] : kStatusNames) {
            if (name == text) {
                return value;
            }
        }
        return std::nullopt;
    }

    const char *to_string(RevocationType type) noexcept {
        switch (type) {
        case RevocationType::SecurityConcern:
            return "SECURITY_CONCERN";
        case RevocationType::DeviceRemoved:
            return "DEVICE_REMOVED";
        case RevocationType::ExpiredReplaced:
            return "EXPIRED_REPLACED";
        }
        return "UNKNOWN";
    }

} // namespace trustlock
