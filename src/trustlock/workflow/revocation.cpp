#include <trustlock/workflow/revocation.hpp>

#include <trustlock/ca/certificate_authority.hpp>
#include <trustlock/cert/pem.hpp>
#include <trustlock/core/log.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock {

    namespace {

        constexpr const char *kRemovalReason = "Device removed from account";

    } // namespace

    std::string crl_checksum(const std::vector<CrlEntrySummary> &entries) {
        std::string joined;
        for (const auto &entry : entries) {
            joined.append(entry.serial_number).push_back('|');
        }
        return utils::to_upper_hex(utils::sha256(std::string_view(joined)));
    }

    cert::CrlReason crl_reason_for(RevocationType type) noexcept {
        switch (type) {
        case RevocationType::SecurityConcern:
            return cert::CrlReason::KeyCompromise;
        case RevocationType::DeviceRemoved:
            return cert::CrlReason::CessationOfOperation;
        case RevocationType::ExpiredReplaced:
            return cert::CrlReason::Superseded;
        }
        return cert::CrlReason::Unspecified;
    }

    RevocationWorkflow::RevocationWorkflow(DeviceRegistry &registry, RevocationLedger &ledger,
                                           WhitelistCache &whitelist, std::shared_ptr<ca::CaSigningContext> ca_context,
                                           TrustConfig config)
        : registry_(registry), ledger_(ledger), whitelist_(whitelist), ca_context_(std::move(ca_context)),
          config_(std::move(config)) {}

    Result<RevocationOutcome> RevocationWorkflow::revoke(std::string_view device_id, std::string_view revoked_by,
                                                         std::string_view reason) {
        log::logger()->warn("revoking certificate for device {} by {}: {}", device_id, revoked_by, reason);
        return retire(device_id, revoked_by, reason, RevocationType::SecurityConcern, DeviceStatus::Revoked);
    }

    Result<RevocationOutcome> RevocationWorkflow::remove(std::string_view device_id, std::string_view removed_by) {
        log::logger()->warn("removing device {} by {}", device_id, removed_by);
        return retire(device_id, removed_by, kRemovalReason, RevocationType::DeviceRemoved, DeviceStatus::Removed);
    }

    Result<RevocationOutcome> RevocationWorkflow::retire(std::string_view device_id, std::string_view actor,
                                                         std::string_view reason, RevocationType type,
                                                         DeviceStatus target) {
        using Outcome = Result<RevocationOutcome>;
        const bool removal = target == DeviceStatus::Removed;

        if (actor.empty()) {
            return Outcome::failure(Error::invalid_input("acting user is required"));
        }

        std::lock_guard<std::mutex> lock(mutex_);

        auto found = registry_.find_by_id(device_id);
        if (!found) {
            return Outcome::failure(Error::not_found("Device not found: " + std::string(device_id)));
        }
        Device device = std::move(*found);

        if (device.status == target) {
            // Repeated call: re-save the terminal state, no new ledger entry
            auto saved = registry_.compare_and_update(device, target);
            if (!saved.success()) {
                return Outcome::failure(saved.error());
            }
            whitelist_.invalidate();
            return Outcome::ok({std::move(device), std::nullopt, true,
                                removal ? "Device already removed" : "Certificate already revoked"});
        }
        if (device.status != DeviceStatus::Active) {
            return Outcome::failure(Error::invalid_state(std::string("Device cannot be ") +
                                                         (removal ? "removed" : "revoked") +
                                                         " from status " + to_string(device.status)));
        }

        const auto now = Clock::now();
        std::optional<RevocationEntry> entry;
        if (device.certificate) {
            RevocationEntry revocation;
            revocation.serial_number = device.certificate->serial;
            revocation.device_id = device.device_id;
            revocation.account_token = device.account_token;
            revocation.revoked_at = now;
            revocation.revoked_by = std::string(actor);
            revocation.reason = std::string(reason);
            revocation.revocation_type = type;
            revocation.certificate_fingerprint = device.certificate->fingerprint;
            revocation.original_expires_at = device.certificate->expires_at;

            auto appended = ledger_.append(revocation);
            if (appended.success()) {
                entry = std::move(revocation);
            } else if (appended.code() != ErrorCode::Conflict) {
                return Outcome::failure(appended.error());
            }
        }

        device.status = target;
        if (removal) {
            device.removed_at = now;
            device.removed_by = std::string(actor);
        } else {
            device.revoked_at = now;
            device.revoked_by = std::string(actor);
            device.revocation_reason = std::string(reason);
        }

        auto updated = registry_.compare_and_update(device, DeviceStatus::Active);
        if (!updated.success()) {
            return Outcome::failure(updated.error());
        }
        whitelist_.invalidate();

        log::logger()->warn("certificate {} revoked for device {} ({})",
                            device.certificate ? device.certificate->serial : std::string("<none>"), device.device_id,
                            to_string(type));
        return Outcome::ok({std::move(device), std::move(entry), false,
                            removal ? "Device removed successfully" : "Certificate revoked and added to CRL"});
    }

    CrlSnapshot RevocationWorkflow::get_crl() const {
        CrlSnapshot snapshot;
        snapshot.generated_at = Clock::now();
        for (const auto &entry : ledger_.entries_newest_first()) {
            snapshot.entries.push_back({entry.serial_number, entry.revoked_at, entry.reason, entry.revocation_type});
        }
        snapshot.total_revoked = snapshot.entries.size();
        snapshot.checksum = crl_checksum(snapshot.entries);
        return snapshot;
    }

    Result<SignedCrlExport> RevocationWorkflow::export_signed_crl() {
        using ExportResult = Result<SignedCrlExport>;

        auto material = ca_context_->material();
        if (!material.success()) {
            return ExportResult::failure(material.error());
        }
        const auto &ca = *material.value();

        const auto this_update = Clock::now();
        const auto next_update = this_update + std::chrono::hours(config_.crl_next_update_hours);

        cert::CrlBuilder builder;
        builder.set_issuer(ca.issuer)
            .set_this_update(this_update)
            .set_next_update(next_update)
            .set_authority_key_identifier(ca.key_identifier);

        std::size_t count = 0;
        for (const auto &entry : ledger_.entries_newest_first()) {
            auto serial = ca::parse_serial(entry.serial_number);
            if (!serial) {
                log::logger()->warn("skipping ledger entry with foreign serial {}", entry.serial_number);
                continue;
            }
            builder.add_revoked(std::move(*serial), entry.revoked_at, crl_reason_for(entry.revocation_type));
            ++count;
        }

        auto crl = builder.build(ca.key_pair);
        if (!crl.success()) {
            log::logger()->critical("CRL signing failed: {}", crl.error().message);
            return ExportResult::failure(crl.error());
        }

        SignedCrlExport out;
        out.der = std::move(crl).value().der;
        out.pem = cert::pem_encode("X509 CRL", out.der);
        out.this_update = this_update;
        out.next_update = next_update;
        out.entry_count = count;
        return ExportResult::ok(std::move(out));
    }

} // namespace trustlock
