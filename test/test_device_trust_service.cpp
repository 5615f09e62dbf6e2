#include <doctest/doctest.h>

#include "trust_test_helpers.hpp"

#include <thread>

using namespace trustlock;
using trust_test::enroll;
using trust_test::make_request;

TEST_SUITE("service/scenarios") {
    TEST_CASE("register, approve, validate, revoke") {
        trust_test::silence_logs();
        DeviceTrustService service;

        auto registered = service.request_registration(make_request("acct-1", "AA:BB:CC:DD:EE:FF", "fp-1"));
        REQUIRE(registered.success());
        CHECK(registered.value().device.status == DeviceStatus::PendingApproval);
        const auto device_id = registered.value().device.device_id;

        const auto before = Clock::now();
        auto approved = service.approve_registration(device_id, "admin");
        REQUIRE(approved.success());
        CHECK(approved.value().device.status == DeviceStatus::Active);
        const auto serial = approved.value().certificate.serial_number;
        CHECK_FALSE(serial.empty());
        const auto days = std::chrono::duration_cast<std::chrono::hours>(approved.value().certificate.expires_at - before)
                              .count() / 24;
        CHECK(days == 365);

        auto valid = service.validate_device(serial, "AA:BB:CC:DD:EE:FF", "fp-1");
        REQUIRE(is_valid(valid));
        CHECK(std::get<Valid>(valid).device_id == device_id);
        CHECK(std::get<Valid>(valid).account_token == "acct-1");
        CHECK(service.find_device(device_id)->last_seen_at.has_value());

        REQUIRE(service.revoke_certificate(device_id, "admin", "stolen").success());
        auto revoked = service.validate_device(serial, "AA:BB:CC:DD:EE:FF", "fp-1");
        CHECK_FALSE(is_valid(revoked));
        CHECK(reason_of(revoked) == "certificate revoked");
    }

    TEST_CASE("sixth device for a full account is refused") {
        trust_test::silence_logs();
        DeviceTrustService service;
        for (unsigned i = 0; i < 5; ++i) {
            enroll(service, "acct-full", trust_test::mac_for(i));
        }
        CHECK(service.devices_for_account("acct-full").size() == 5);

        auto sixth = service.request_registration(make_request("acct-full", trust_test::mac_for(5)));
        REQUIRE_FALSE(sixth.success());
        CHECK(sixth.code() == ErrorCode::LimitExceeded);
        CHECK(sixth.error().device_count == std::optional<std::size_t>(5));
    }

    TEST_CASE("correct serial with a wrong MAC raises a security alert") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto enrolled = enroll(service, "acct-1", "AA:BB:CC:DD:EE:FF");
        auto verdict = service.validate_device(enrolled.certificate.serial_number, "11:22:33:44:55:66", "fp-secret");
        CHECK_FALSE(is_valid(verdict));
        CHECK(is_security_alert(verdict));
        CHECK(reason_of(verdict) == "device identifier mismatch");
    }

    TEST_CASE("CRL after two revocations") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto a = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");
        auto b = enroll(service, "acct-1", "AA:BB:CC:DD:EE:02");
        REQUIRE(service.revoke_certificate(a.device.device_id, "admin", "a").success());
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(service.revoke_certificate(b.device.device_id, "admin", "b").success());

        auto crl = service.get_crl();
        REQUIRE(crl.entries.size() == 2);
        CHECK(crl.entries[0].serial_number == b.certificate.serial_number);
        CHECK(crl.entries[1].serial_number == a.certificate.serial_number);

        auto altered = crl.entries;
        altered[0].serial_number += "0";
        CHECK(crl_checksum(altered) != crl.checksum);
    }

    TEST_CASE("approval and removal are visible to the next validation") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto first = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");
        CHECK(is_valid(service.validate_device(first.certificate.serial_number, "AA:BB:CC:DD:EE:01", "fp-secret")));
        CHECK(service.whitelist().is_populated());

        auto second = enroll(service, "acct-1", "AA:BB:CC:DD:EE:02");
        CHECK_FALSE(service.whitelist().is_populated());
        CHECK(is_valid(service.validate_device(second.certificate.serial_number, "AA:BB:CC:DD:EE:02", "fp-secret")));

        REQUIRE(service.remove_device(first.device.device_id, "owner").success());
        CHECK_FALSE(service.whitelist().is_populated());
        CHECK_FALSE(service.whitelist().get_or_rebuild()->count("AA:BB:CC:DD:EE:01"));
        CHECK_FALSE(is_valid(service.validate_device(first.certificate.serial_number, "AA:BB:CC:DD:EE:01", "fp-secret")));
    }

    TEST_CASE("a removed device can register again under a new id") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto first = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");
        REQUIRE(service.remove_device(first.device.device_id, "owner").success());

        auto again = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");
        CHECK(again.device.device_id != first.device.device_id);
        CHECK(again.certificate.serial_number != first.certificate.serial_number);
        CHECK(is_valid(service.validate_device(again.certificate.serial_number, "AA:BB:CC:DD:EE:01", "fp-secret")));
        CHECK(reason_of(service.validate_device(first.certificate.serial_number, "AA:BB:CC:DD:EE:01", "fp-secret")) ==
              "certificate revoked");
    }

    TEST_CASE("concurrent validations alongside revocations") {
        trust_test::silence_logs();
        DeviceTrustService service;
        std::vector<ApprovalOutcome> devices;
        for (unsigned i = 0; i < 4; ++i) {
            devices.push_back(enroll(service, "acct-" + std::to_string(i), trust_test::mac_for(i)));
        }

        std::atomic<bool> stop{false};
        std::atomic<int> valid_after_revocation{0};
        std::atomic<bool> revoked_zero{false};
        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&] {
                while (!stop.load()) {
                    const bool was_revoked = revoked_zero.load();
                    auto verdict = service.validate_device(devices[0].certificate.serial_number,
                                                           trust_test::mac_for(0), "fp-secret");
                    if (was_revoked && is_valid(verdict)) {
                        ++valid_after_revocation;
                    }
                    (void)service.validate_device(devices[1].certificate.serial_number, trust_test::mac_for(1),
                                                  "fp-secret");
                }
            });
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(service.revoke_certificate(devices[0].device.device_id, "admin", "rotate").success());
        revoked_zero.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.store(true);
        for (auto &reader : readers) {
            reader.join();
        }

        CHECK(valid_after_revocation.load() == 0);
        CHECK(is_valid(service.validate_device(devices[1].certificate.serial_number, trust_test::mac_for(1),
                                               "fp-secret")));
    }
}

TEST_SUITE("service/queries") {
    TEST_CASE("listing and counting") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto active = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");
        auto pending = service.request_registration(make_request("acct-1", "AA:BB:CC:DD:EE:02"));
        REQUIRE(pending.success());
        auto revoked = enroll(service, "acct-2", "AA:BB:CC:DD:EE:03");
        REQUIRE(service.revoke_certificate(revoked.device.device_id, "admin", "x").success());

        CHECK(service.pending_count() == 1);
        CHECK(service.active_count() == 1);
        CHECK(service.revoked_certificate_count() == 1);
        REQUIRE(service.pending_registrations().size() == 1);
        CHECK(service.pending_registrations()[0].device_id == pending.value().device.device_id);
        REQUIRE(service.active_devices().size() == 1);
        CHECK(service.active_devices()[0].device_id == active.device.device_id);

        auto account = service.devices_for_account("acct-1");
        REQUIRE(account.size() == 2);
        CHECK(account[0].requested_at >= account[1].requested_at);
    }

    TEST_CASE("search and expiring certificates") {
        trust_test::silence_logs();
        TrustConfig config;
        config.certificate_validity_days = 20;
        DeviceTrustService service(config);
        auto device = enroll(service, "acct-1", "AA:BB:CC:DD:EE:01");

        CHECK(service.search_devices("front desk").size() == 1);
        CHECK(service.search_devices(device.device.device_id).size() == 1);
        CHECK(service.search_devices("ee:01").size() == 1);
        CHECK(service.search_devices("printer").empty());

        CHECK(service.devices_expiring_within(30).size() == 1);
        CHECK(service.devices_expiring_within(10).empty());
    }

    TEST_CASE("CA trust anchor") {
        trust_test::silence_logs();
        DeviceTrustService service;
        REQUIRE(service.initialize_ca().success());
        auto pem = service.ca_certificate_pem();
        REQUIRE(pem.success());
        CHECK(pem.value().rfind("-----BEGIN CERTIFICATE-----\n", 0) == 0);
        CHECK(service.ca_certificate_pem().value() == pem.value());
    }

    TEST_CASE("invalid configuration is refused") {
        TrustConfig config;
        config.max_devices_per_account = 0;
        CHECK_THROWS_AS(DeviceTrustService{config}, std::invalid_argument);
    }
}

TEST_SUITE("service/injection") {
    TEST_CASE("injected signing context backs issuance, CRL and trust anchor") {
        trust_test::silence_logs();
        TrustConfig config;
        auto context = std::make_shared<ca::CaSigningContext>(config);
        auto issuer = std::make_shared<ca::DeviceCertificateAuthority>(context, config);
        DeviceTrustService service(config, nullptr, nullptr, issuer, context);

        auto approval = enroll(service, "acct-ctx", "AA:BB:CC:00:00:01");
        REQUIRE(context->initialized());
        auto material = context->material();
        REQUIRE(material.success());

        auto pem = service.ca_certificate_pem();
        REQUIRE(pem.success());
        CHECK(pem.value() == material.value()->certificate_pem);
        CHECK(approval.certificate.issuer_dn == material.value()->issuer.to_string());

        REQUIRE(service.revoke_certificate(approval.device.device_id, "admin", "lost").success());
        auto crl = service.export_signed_crl();
        REQUIRE(crl.success());
        CHECK(trust_test::contains_bytes(crl.value().der, material.value()->key_identifier));
    }

    TEST_CASE("signing context alone also drives the built-in issuer") {
        trust_test::silence_logs();
        TrustConfig config;
        auto context = std::make_shared<ca::CaSigningContext>(config);
        DeviceTrustService service(config, nullptr, nullptr, nullptr, context);

        CHECK_FALSE(context->initialized());
        enroll(service, "acct-ctx", "AA:BB:CC:00:00:02");
        CHECK(context->initialized());
        CHECK(service.ca_certificate_pem().value() == context->material().value()->certificate_pem);
    }
}

TEST_SUITE("service/crypto_failures") {
    TEST_CASE("approval while libsodium is unavailable leaves the device pending") {
        trust_test::silence_logs();
        DeviceTrustService service;
        auto registered = service.request_registration(make_request("acct-na", "AA:BB:CC:00:00:03"));
        REQUIRE(registered.success());
        const auto device_id = registered.value().device.device_id;

        {
            trust_test::SodiumOutage outage;
            auto approved = service.approve_registration(device_id, "admin");
            REQUIRE_FALSE(approved.success());
            CHECK(approved.code() == ErrorCode::CryptoFailure);
            CHECK(approved.error().crypto == CryptoFailureKind::AlgorithmUnavailable);
            CHECK(service.find_device(device_id)->status == DeviceStatus::PendingApproval);

            auto crl = service.export_signed_crl();
            REQUIRE_FALSE(crl.success());
            CHECK(crl.error().crypto == CryptoFailureKind::AlgorithmUnavailable);

            auto second = service.request_registration(make_request("acct-na", "AA:BB:CC:00:00:04"));
            REQUIRE_FALSE(second.success());
            CHECK(second.error().crypto == CryptoFailureKind::AlgorithmUnavailable);
        }

        auto approved = service.approve_registration(device_id, "admin");
        REQUIRE(approved.success());
        CHECK(approved.value().device.status == DeviceStatus::Active);
        CHECK(service.export_signed_crl().success());
    }
}
