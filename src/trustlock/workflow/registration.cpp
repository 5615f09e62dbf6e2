#include <trustlock/workflow/registration.hpp>

#include <trustlock/core/log.hpp>
#include <trustlock/device/mac_address.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock {

    namespace {

        constexpr const char *kDeviceIdPrefix = "DEV-";
        constexpr size_t kDeviceIdRandomBytes = 4;

        constexpr const char *kInstallationInstructions = "1. Download certificate from admin portal\n"
                                                          "2. Install certificate in device trust store\n"
                                                          "3. Configure app to use certificate for authentication";

    } // namespace

    RegistrationWorkflow::RegistrationWorkflow(DeviceRegistry &registry, ca::CertificateIssuer &issuer,
                                               WhitelistCache &whitelist, TrustConfig config)
        : registry_(registry), issuer_(issuer), whitelist_(whitelist), config_(std::move(config)) {}

    Result<std::string> RegistrationWorkflow::generate_device_id() const {
        auto random = utils::Common::generate_random_bytes(kDeviceIdRandomBytes);
        if (!random.success()) {
            return Result<std::string>::failure(random.error());
        }
        return Result<std::string>::ok(kDeviceIdPrefix + utils::to_upper_hex(random.value()));
    }

    Result<RegistrationOutcome> RegistrationWorkflow::request_registration(const RegistrationRequest &request) {
        using Outcome = Result<RegistrationOutcome>;
        log::logger()->info("registration request for account {} from MAC {}", request.account_token,
                            request.mac_address);

        if (request.account_token.empty()) {
            return Outcome::failure(Error::invalid_input("account token is required"));
        }
        auto mac_address = mac::canonicalize(request.mac_address);
        if (!mac_address) {
            return Outcome::failure(Error::invalid_input("Invalid MAC address format"));
        }

        std::lock_guard<std::mutex> lock(registration_mutex_);

        if (auto existing = registry_.find_active_by_mac(*mac_address)) {
            return Outcome::failure(Error::conflict("Device is already registered", existing->device_id));
        }

        const auto device_count = registry_.count_for_account(
            request.account_token, {DeviceStatus::Rejected, DeviceStatus::Removed});
        if (device_count >= config_.max_devices_per_account) {
            return Outcome::failure(Error::limit_exceeded(
                "Maximum device limit reached (" + std::to_string(config_.max_devices_per_account) + ")",
                device_count));
        }

        Device device;
        do {
            auto device_id = generate_device_id();
            if (!device_id.success()) {
                log::logger()->critical("device id generation failed: {}", device_id.error().message);
                return Outcome::failure(device_id.error());
            }
            device.device_id = std::move(device_id).value();
        } while (registry_.contains(device.device_id));
        device.account_token = request.account_token;
        device.mac_address = *mac_address;
        device.device_fingerprint = request.device_fingerprint;
        device.device_name = request.device_name;
        device.device_type = request.device_type;
        device.os = request.os;
        device.status = DeviceStatus::PendingApproval;
        device.requested_at = Clock::now();

        auto inserted = registry_.insert(device);
        if (!inserted.success()) {
            return Outcome::failure(inserted.error());
        }

        log::logger()->info("created pending registration {} for account {}", device.device_id,
                            device.account_token);
        return Outcome::ok({std::move(device), "Registration request submitted. Awaiting administrator approval."});
    }

    Result<Device> RegistrationWorkflow::load_pending(std::string_view device_id) const {
        auto device = registry_.find_by_id(device_id);
        if (!device) {
            return Result<Device>::failure(Error::not_found("Device not found: " + std::string(device_id)));
        }
        if (device->status != DeviceStatus::PendingApproval) {
            return Result<Device>::failure(
                Error::invalid_state(std::string("Device is not in pending status: ") + to_string(device->status)));
        }
        return Result<Device>::ok(std::move(*device));
    }

    Result<ApprovalOutcome> RegistrationWorkflow::approve(std::string_view device_id, std::string_view approved_by) {
        using Outcome = Result<ApprovalOutcome>;
        log::logger()->warn("approving device {} by {}", device_id, approved_by);

        if (approved_by.empty()) {
            return Outcome::failure(Error::invalid_input("approving actor is required"));
        }
        auto pending = load_pending(device_id);
        if (!pending.success()) {
            return Outcome::failure(pending.error());
        }
        Device device = std::move(pending).value();

        auto issued = issuer_.issue(device);
        if (!issued.success()) {
            return Outcome::failure(issued.error());
        }
        auto certificate = std::move(issued).value();

        device.status = DeviceStatus::Active;
        device.approved_at = Clock::now();
        device.approved_by = std::string(approved_by);
        device.certificate = CertificateBinding{certificate.serial_number, certificate.fingerprint,
                                                certificate.expires_at};

        // A concurrent approve or reject may have moved the device on; the certificate is then discarded
        auto updated = registry_.compare_and_update(device, DeviceStatus::PendingApproval);
        if (!updated.success()) {
            return Outcome::failure(updated.error());
        }
        whitelist_.invalidate();

        log::logger()->warn("device {} approved by {}. Certificate: {}", device.device_id, approved_by,
                            certificate.serial_number);
        return Outcome::ok({std::move(device), std::move(certificate), kInstallationInstructions,
                            "Device approved. Certificate must be installed on device."});
    }

    Result<RejectionOutcome> RegistrationWorkflow::reject(std::string_view device_id, std::string_view rejected_by,
                                                          std::string_view reason) {
        using Outcome = Result<RejectionOutcome>;
        log::logger()->warn("rejecting device {} by {}: {}", device_id, rejected_by, reason);

        if (rejected_by.empty()) {
            return Outcome::failure(Error::invalid_input("rejecting actor is required"));
        }
        auto pending = load_pending(device_id);
        if (!pending.success()) {
            return Outcome::failure(pending.error());
        }
        Device device = std::move(pending).value();
        device.status = DeviceStatus::Rejected;
        device.rejected_at = Clock::now();
        device.rejected_by = std::string(rejected_by);
        device.rejection_reason = std::string(reason);

        auto updated = registry_.compare_and_update(device, DeviceStatus::PendingApproval);
        if (!updated.success()) {
            return Outcome::failure(updated.error());
        }
        return Outcome::ok({std::move(device), "Device registration rejected"});
    }

} // namespace trustlock
