#include <trustlock/core/config.hpp>

#include <trustlock/cert/distinguished_name.hpp>

namespace trustlock {

    BoolResult TrustConfig::validate() const {
        if (max_devices_per_account == 0) {
            return BoolResult::failure(Error::invalid_input("max_devices_per_account must be at least 1"));
        }
        if (certificate_validity_days <= 0) {
            return BoolResult::failure(Error::invalid_input("certificate_validity_days must be positive"));
        }
        if (ca_validity_days < certificate_validity_days) {
            return BoolResult::failure(
                Error::invalid_input("ca_validity_days must cover the device certificate validity"));
        }
        if (crl_next_update_hours <= 0) {
            return BoolResult::failure(Error::invalid_input("crl_next_update_hours must be positive"));
        }
        if (device_organization.empty()) {
            return BoolResult::failure(Error::invalid_input("device_organization must not be empty"));
        }
        auto dn = cert::DistinguishedName::from_string(ca_distinguished_name);
        if (!dn.success) {
            return BoolResult::failure(Error::invalid_input("ca_distinguished_name: " + dn.error));
        }
        return BoolResult::ok(true);
    }

} // namespace trustlock
