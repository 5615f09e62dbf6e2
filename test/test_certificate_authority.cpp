#include <doctest/doctest.h>

#include "trust_test_helpers.hpp"

#include <set>
#include <thread>

#include <trustlock/cert/key_utils.hpp>

using namespace trustlock;
using namespace trustlock::ca;

namespace {

    Device pending_device(std::string id = "DEV-0A1B2C3D") {
        Device device;
        device.device_id = std::move(id);
        device.account_token = "acct-1";
        device.mac_address = "AA:BB:CC:DD:EE:FF";
        device.device_type = "TABLET";
        device.status = DeviceStatus::PendingApproval;
        device.requested_at = Clock::now();
        return device;
    }

} // namespace

TEST_SUITE("ca/signing_context") {
    TEST_CASE("key pair is created lazily and once") {
        trust_test::silence_logs();
        CaSigningContext context{TrustConfig{}};
        CHECK_FALSE(context.initialized());

        auto first = context.material();
        REQUIRE(first.success());
        CHECK(context.initialized());

        REQUIRE(context.initialize().success());
        auto second = context.material();
        REQUIRE(second.success());
        CHECK(first.value().get() == second.value().get());
        CHECK(first.value()->key_pair.public_key == second.value()->key_pair.public_key);
    }

    TEST_CASE("concurrent first use publishes a single key pair") {
        trust_test::silence_logs();
        CaSigningContext context{TrustConfig{}};
        std::vector<std::shared_ptr<const CaMaterial>> seen(8);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < seen.size(); ++i) {
            threads.emplace_back([&, i] {
                auto material = context.material();
                if (material.success()) {
                    seen[i] = material.value();
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        for (const auto &material : seen) {
            REQUIRE(material != nullptr);
            CHECK(material.get() == seen.front().get());
        }
    }

    TEST_CASE("self-signed CA certificate") {
        trust_test::silence_logs();
        CaSigningContext context{TrustConfig{}};
        auto material = context.material();
        REQUIRE(material.success());
        const auto &ca = *material.value();

        CHECK(ca.issuer.to_string() == "CN=Trustlock Device CA, O=Trustlock, OU=Device Authentication, C=US");
        CHECK(ca.certificate.subject.der() == ca.certificate.issuer.der());
        CHECK(cert::verify_ed25519(ca.certificate.tbs_der, ca.certificate.signature, ca.key_pair.public_key));
        // basicConstraints cA=TRUE, pathLen 0
        CHECK(trust_test::contains_bytes(ca.certificate.der, {0x30, 0x06, 0x01, 0x01, 0xFF, 0x02, 0x01, 0x00}));
        // keyUsage keyCertSign | cRLSign
        CHECK(trust_test::contains_bytes(ca.certificate.der, {0x03, 0x02, 0x01, 0x06}));
        CHECK(ca.key_identifier.size() == 20);
        CHECK(ca.certificate.validity.contains(Clock::now()));
        CHECK(ca.certificate_pem.rfind("-----BEGIN CERTIFICATE-----", 0) == 0);

        const auto lifetime = ca.certificate.validity.not_after - ca.certificate.validity.not_before;
        CHECK(std::chrono::duration_cast<std::chrono::hours>(lifetime).count() == 24 * 3650);
    }
}

TEST_SUITE("ca/authority") {
    TEST_CASE("issued certificate artifacts") {
        trust_test::silence_logs();
        TrustConfig config;
        auto context = std::make_shared<CaSigningContext>(config);
        DeviceCertificateAuthority authority(context, config);

        const auto before = Clock::now();
        auto issued = authority.issue(pending_device());
        REQUIRE(issued.success());
        const auto &cert = issued.value();

        CHECK(cert.serial_number.rfind("CERT-", 0) == 0);
        CHECK(cert.serial_number.size() == 5 + 32);
        CHECK(cert.fingerprint.rfind("SHA256:", 0) == 0);
        CHECK(cert.fingerprint.size() == 7 + 64);
        CHECK(cert.key_algorithm == "Ed25519");
        CHECK(cert.signature_algorithm == "Ed25519");
        CHECK(cert.subject_dn == "CN=DEV-0A1B2C3D, O=Trustlock Device, OU=TABLET, SERIALNUMBER=AABBCCDDEEFF");
        CHECK(cert.issuer_dn == "CN=Trustlock Device CA, O=Trustlock, OU=Device Authentication, C=US");
        CHECK_FALSE(cert.public_key_base64.empty());
        CHECK(cert.certificate_pem.find(cert.certificate_base64.substr(0, 64)) != std::string::npos);

        const auto validity = std::chrono::duration_cast<std::chrono::hours>(cert.expires_at - before).count();
        CHECK(validity >= 365 * 24 - 1);
        CHECK(validity <= 365 * 24 + 1);
        CHECK(context->initialized());
    }

    TEST_CASE("unknown device type falls back to Unknown") {
        trust_test::silence_logs();
        TrustConfig config;
        DeviceCertificateAuthority authority(std::make_shared<CaSigningContext>(config), config);
        auto device = pending_device();
        device.device_type.clear();
        auto issued = authority.issue(device);
        REQUIRE(issued.success());
        CHECK(issued.value().subject_dn.find("OU=Unknown") != std::string::npos);
    }

    TEST_CASE("serial numbers do not repeat") {
        trust_test::silence_logs();
        TrustConfig config;
        DeviceCertificateAuthority authority(std::make_shared<CaSigningContext>(config), config);
        std::set<std::string> serials;
        const auto device = pending_device();
        for (int i = 0; i < 2000; ++i) {
            auto issued = authority.issue(device);
            REQUIRE(issued.success());
            serials.insert(issued.value().serial_number);
        }
        CHECK(serials.size() == 2000);
    }

    TEST_CASE("serial formatting round trip and fingerprint") {
        const std::vector<uint8_t> serial{0x0A, 0xBC, 0x01};
        CHECK(format_serial(serial) == "CERT-0ABC01");
        CHECK(parse_serial("CERT-0ABC01") == std::optional<std::vector<uint8_t>>(serial));
        CHECK_FALSE(parse_serial("SER-0ABC01").has_value());
        CHECK_FALSE(parse_serial("CERT-").has_value());
        CHECK_FALSE(parse_serial("CERT-XYZ").has_value());

        // SHA-256("abc")
        const std::vector<uint8_t> abc{'a', 'b', 'c'};
        CHECK(certificate_fingerprint(abc) ==
              "SHA256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    }
}
