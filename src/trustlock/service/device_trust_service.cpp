#include <trustlock/service/device_trust_service.hpp>

#include <stdexcept>

namespace trustlock {

    TrustConfig DeviceTrustService::checked(TrustConfig config) {
        auto valid = config.validate();
        if (!valid.success()) {
            throw std::invalid_argument("invalid trust configuration: " + valid.error().message);
        }
        return config;
    }

    DeviceTrustService::DeviceTrustService(TrustConfig config)
        : DeviceTrustService(std::move(config), nullptr, nullptr, nullptr, nullptr) {}

    DeviceTrustService::DeviceTrustService(TrustConfig config, std::shared_ptr<DeviceRegistry> registry,
                                           std::shared_ptr<RevocationLedger> ledger,
                                           std::shared_ptr<ca::CertificateIssuer> issuer,
                                           std::shared_ptr<ca::CaSigningContext> ca_context)
        : config_(checked(std::move(config))),
          registry_(registry ? std::move(registry)
                             : std::shared_ptr<DeviceRegistry>(std::make_shared<InMemoryDeviceRegistry>())),
          ledger_(ledger ? std::move(ledger)
                         : std::shared_ptr<RevocationLedger>(std::make_shared<InMemoryRevocationLedger>())),
          ca_context_(ca_context ? std::move(ca_context) : std::make_shared<ca::CaSigningContext>(config_)),
          issuer_(issuer ? std::move(issuer)
                         : std::shared_ptr<ca::CertificateIssuer>(
                               std::make_shared<ca::DeviceCertificateAuthority>(ca_context_, config_))),
          whitelist_(*registry_), registration_(*registry_, *issuer_, whitelist_, config_),
          revocation_(*registry_, *ledger_, whitelist_, ca_context_, config_),
          pipeline_(*ledger_, *registry_, whitelist_) {}

    Result<RegistrationOutcome> DeviceTrustService::request_registration(const RegistrationRequest &request) {
        return registration_.request_registration(request);
    }

    Result<ApprovalOutcome> DeviceTrustService::approve_registration(std::string_view device_id,
                                                                     std::string_view approved_by) {
        return registration_.approve(device_id, approved_by);
    }

    Result<RejectionOutcome> DeviceTrustService::reject_registration(std::string_view device_id,
                                                                     std::string_view rejected_by,
                                                                     std::string_view reason) {
        return registration_.reject(device_id, rejected_by, reason);
    }

    Result<RevocationOutcome> DeviceTrustService::revoke_certificate(std::string_view device_id,
                                                                     std::string_view revoked_by,
                                                                     std::string_view reason) {
        return revocation_.revoke(device_id, revoked_by, reason);
    }

    Result<RevocationOutcome> DeviceTrustService::remove_device(std::string_view device_id,
                                                                std::string_view removed_by) {
        return revocation_.remove(device_id, removed_by);
    }

    CrlSnapshot DeviceTrustService::get_crl() const { return revocation_.get_crl(); }

    Result<SignedCrlExport> DeviceTrustService::export_signed_crl() { return revocation_.export_signed_crl(); }

    ValidationVerdict DeviceTrustService::validate_device(std::string_view certificate_serial,
                                                          std::string_view mac_address,
                                                          std::string_view device_fingerprint) {
        return pipeline_.validate(
            {std::string(certificate_serial), std::string(mac_address), std::string(device_fingerprint)});
    }

    BoolResult DeviceTrustService::initialize_ca() { return ca_context_->initialize(); }

    Result<std::string> DeviceTrustService::ca_certificate_pem() {
        auto material = ca_context_->material();
        if (!material.success()) {
            return Result<std::string>::failure(material.error());
        }
        return Result<std::string>::ok(material.value()->certificate_pem);
    }

    std::optional<Device> DeviceTrustService::find_device(std::string_view device_id) const {
        return registry_->find_by_id(device_id);
    }

    std::vector<Device> DeviceTrustService::devices_for_account(std::string_view account_token) const {
        return registry_->find_by_account(account_token);
    }

    std::vector<Device> DeviceTrustService::pending_registrations() const {
        return registry_->find_by_status(DeviceStatus::PendingApproval);
    }

    std::vector<Device> DeviceTrustService::active_devices() const {
        return registry_->find_by_status(DeviceStatus::Active);
    }

    std::size_t DeviceTrustService::pending_count() const {
        return registry_->count_by_status(DeviceStatus::PendingApproval);
    }

    std::size_t DeviceTrustService::active_count() const { return registry_->count_by_status(DeviceStatus::Active); }

    std::size_t DeviceTrustService::revoked_certificate_count() const { return ledger_->size(); }

    std::vector<Device> DeviceTrustService::search_devices(std::string_view term) const {
        return registry_->search(term);
    }

    std::vector<Device> DeviceTrustService::devices_expiring_within(int days) const {
        const auto now = Clock::now();
        return registry_->find_expiring(now, now + std::chrono::hours(24) * days);
    }

} // namespace trustlock
