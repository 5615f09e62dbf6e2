#pragma once

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <doctest/doctest.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <trustlock/trustlock.hpp>
#include <trustlock/utils/sodium_utils.hpp>

namespace trust_test {

    // Keeps test output readable; the library logs every denial at warn
    inline void silence_logs() {
        static const bool installed = [] {
            trustlock::log::set_logger(std::make_shared<spdlog::logger>(
                trustlock::log::kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>()));
            return true;
        }();
        (void)installed;
    }

    inline trustlock::cert::DistinguishedName dn_from_string(std::string_view str) {
        auto parsed = trustlock::cert::DistinguishedName::from_string(str);
        REQUIRE(parsed.success);
        return parsed.value;
    }

    inline bool contains_bytes(const std::vector<uint8_t> &haystack, const std::vector<uint8_t> &needle) {
        return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
    }

    inline bool contains_text(const std::vector<uint8_t> &haystack, std::string_view text) {
        return contains_bytes(haystack, std::vector<uint8_t>(text.begin(), text.end()));
    }

    inline trustlock::RegistrationRequest make_request(std::string account, std::string mac,
                                                       std::string fingerprint = "fp-secret") {
        trustlock::RegistrationRequest request;
        request.account_token = std::move(account);
        request.mac_address = std::move(mac);
        request.device_fingerprint = std::move(fingerprint);
        request.device_name = "Front Desk Tablet";
        request.device_type = "TABLET";
        request.os = "Android 14";
        return request;
    }

    // Formats a MAC from an index, e.g. 3 -> "02:00:00:00:00:03"
    inline std::string mac_for(unsigned index) {
        char buffer[18];
        std::snprintf(buffer, sizeof(buffer), "02:00:00:00:%02X:%02X", (index >> 8) & 0xFFU, index & 0xFFU);
        return buffer;
    }

    // Registers and approves a device, returning the approval outcome
    inline trustlock::ApprovalOutcome enroll(trustlock::DeviceTrustService &service, const std::string &account,
                                             const std::string &mac, const std::string &fingerprint = "fp-secret") {
        auto registered = service.request_registration(make_request(account, mac, fingerprint));
        REQUIRE(registered.success());
        auto approved = service.approve_registration(registered.value().device.device_id, "admin");
        REQUIRE(approved.success());
        return approved.value();
    }

    // Active device record with a certificate binding, for crafting registry states directly
    inline trustlock::Device make_active_device(std::string device_id, std::string mac, std::string serial,
                                                trustlock::Timestamp expires_at) {
        trustlock::Device device;
        device.device_id = std::move(device_id);
        device.account_token = "acct-crafted";
        device.mac_address = std::move(mac);
        device.device_fingerprint = "fp-crafted";
        device.status = trustlock::DeviceStatus::Active;
        device.requested_at = trustlock::Clock::now() - std::chrono::hours(48);
        device.approved_at = trustlock::Clock::now() - std::chrono::hours(47);
        device.approved_by = "admin";
        device.certificate = trustlock::CertificateBinding{std::move(serial), "SHA256:00", expires_at};
        return device;
    }

    // Withholds libsodium for the lifetime of the guard
    struct SodiumOutage {
        SodiumOutage() { trustlock::utils::withhold_sodium(true); }
        ~SodiumOutage() { trustlock::utils::withhold_sodium(false); }
        SodiumOutage(const SodiumOutage &) = delete;
        SodiumOutage &operator=(const SodiumOutage &) = delete;
    };

    // Issuer that always fails the way an unavailable provider would
    class FailingIssuer : public trustlock::ca::CertificateIssuer {
      public:
        trustlock::Result<trustlock::ca::IssuedCertificate> issue(const trustlock::Device &) override {
            ++calls;
            return trustlock::Result<trustlock::ca::IssuedCertificate>::failure(trustlock::Error::crypto_failure(
                trustlock::CryptoFailureKind::AlgorithmUnavailable, "provider unavailable"));
        }

        int calls{0};
    };

} // namespace trust_test
