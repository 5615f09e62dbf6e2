#include <trustlock/verify/validation_pipeline.hpp>

#include <trustlock/core/log.hpp>
#include <trustlock/device/mac_address.hpp>

namespace trustlock {

    ValidationPipeline::ValidationPipeline(const RevocationLedger &ledger, DeviceRegistry &registry,
                                           WhitelistCache &whitelist)
        : ledger_(ledger), registry_(registry), whitelist_(whitelist) {}

    ValidationVerdict ValidationPipeline::validate(const ValidationRequest &request) {
        auto verdict = evaluate(request);
        if (const auto *invalid = std::get_if<Invalid>(&verdict)) {
            if (invalid->security_alert) {
                log::logger()->warn("security alert: {} (serial {}, MAC {})", invalid->reason,
                                    request.certificate_serial, request.mac_address);
            } else {
                log::logger()->warn("validation denied: {} (serial {})", invalid->reason,
                                    request.certificate_serial);
            }
        } else {
            log::logger()->debug("device {} validated", std::get<Valid>(verdict).device_id);
        }
        return verdict;
    }

    ValidationVerdict ValidationPipeline::evaluate(const ValidationRequest &request) {
        if (ledger_.contains(request.certificate_serial)) {
            return Invalid{reasons::kRevoked};
        }

        auto device = registry_.find_by_certificate_serial(request.certificate_serial);
        if (!device) {
            return Invalid{reasons::kNotRecognized};
        }

        if (!mac::equals(device->mac_address, request.mac_address)) {
            return Invalid{reasons::kIdentifierMismatch, true};
        }

        if (!whitelist_.contains(request.mac_address)) {
            return Invalid{reasons::kNotAuthorized};
        }

        if (!device->device_fingerprint.empty() && device->device_fingerprint != request.device_fingerprint) {
            return Invalid{reasons::kVerificationFailed, true};
        }

        const auto now = Clock::now();
        if (device->certificate && device->certificate->expires_at < now) {
            return Invalid{reasons::kExpired};
        }

        if (device->status != DeviceStatus::Active) {
            return Invalid{std::string(reasons::kNotActivePrefix) + to_string(device->status)};
        }

        if (!registry_.touch_last_seen(device->device_id, now)) {
            log::logger()->warn("could not record last_seen_at for {}", device->device_id);
        }
        return Valid{device->device_id, device->account_token};
    }

} // namespace trustlock
