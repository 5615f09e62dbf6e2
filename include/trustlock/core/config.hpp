#pragma once

#include <cstddef>
#include <string>

#include <trustlock/core/result.hpp>

namespace trustlock {

    // Trust subsystem configuration
    struct TrustConfig {
        std::size_t max_devices_per_account{5};
        int certificate_validity_days{365};
        std::string ca_distinguished_name{"CN=Trustlock Device CA, O=Trustlock, OU=Device Authentication, C=US"};
        int ca_validity_days{3650};                        // Self-signed CA certificate lifetime
        std::string device_organization{"Trustlock Device"}; // O= attribute of device subjects
        int crl_next_update_hours{24};                     // nextUpdate offset of exported CRLs

        TrustConfig() = default;

        [[nodiscard]] BoolResult validate() const;
    };

} // namespace trustlock
