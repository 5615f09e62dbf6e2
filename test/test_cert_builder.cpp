#include <doctest/doctest.h>

#include "trust_test_helpers.hpp"

#include <trustlock/cert/builder.hpp>
#include <trustlock/cert/crl_builder.hpp>
#include <trustlock/cert/pem.hpp>

using namespace trustlock::cert;
using Bytes = std::vector<uint8_t>;

namespace {

    KeyPair fresh_key() {
        auto keys = generate_ed25519_keypair();
        REQUIRE(keys.success());
        return keys.value();
    }

} // namespace

TEST_SUITE("cert/builder") {
    TEST_CASE("device certificate carries the requested extensions") {
        auto ca_key = fresh_key();
        auto device_key = fresh_key();
        auto issuer = trust_test::dn_from_string("CN=Test CA, O=Trustlock");
        auto subject = trust_test::dn_from_string("CN=DEV-00000001, O=Trustlock Device, OU=TABLET");
        const auto now = std::chrono::system_clock::now();

        CertificateBuilder builder;
        builder.set_serial(Bytes{0x01, 0x02, 0x03})
            .set_issuer(issuer)
            .set_subject(subject)
            .set_validity(now, now + std::chrono::hours(24))
            .set_subject_public_key_ed25519(device_key.public_key)
            .set_key_usage(key_usage::DigitalSignature | key_usage::KeyEncipherment)
            .set_extended_key_usage({KeyPurposeId::ClientAuth})
            .set_basic_constraints(false, std::nullopt)
            .set_subject_key_identifier(key_identifier(device_key.public_key));

        auto built = builder.build(ca_key);
        REQUIRE(built.success());
        const auto &cert = built.value();

        CHECK(cert.der[0] == 0x30);
        CHECK(cert.serial_number == Bytes{0x01, 0x02, 0x03});
        CHECK(cert.issuer.to_string() == issuer.to_string());
        CHECK(trust_test::contains_bytes(cert.der, {0x06, 0x08, 0x2B, 0x06, 0x01, 0x05, 0x05, 0x07, 0x03, 0x02}));
        // keyUsage OCTET STRING wrapping the named bit string
        CHECK(trust_test::contains_bytes(cert.der, {0x04, 0x04, 0x03, 0x02, 0x05, 0xA0}));
        // basicConstraints cA=false encodes as an empty SEQUENCE
        CHECK(trust_test::contains_bytes(cert.der, {0x06, 0x03, 0x55, 0x1D, 0x13, 0x01, 0x01, 0xFF, 0x04, 0x02,
                                                    0x30, 0x00}));
        CHECK(trust_test::contains_bytes(cert.der, key_identifier(device_key.public_key)));
        CHECK(trust_test::contains_bytes(cert.der, spki_from_ed25519_public(device_key.public_key)));
        CHECK(trust_test::contains_text(cert.der, "DEV-00000001"));

        CHECK(verify_ed25519(cert.tbs_der, cert.signature, ca_key.public_key));
        CHECK_FALSE(verify_ed25519(cert.tbs_der, cert.signature, device_key.public_key));
        CHECK(std::equal(cert.signature.rbegin(), cert.signature.rend(), cert.der.rbegin()));
    }

    TEST_CASE("random serials use all 128 bits and encode as positive integers") {
        auto key = fresh_key();
        auto dn = trust_test::dn_from_string("CN=Self");
        const auto now = std::chrono::system_clock::now();
        CertificateBuilder builder;
        builder.set_subject(dn)
            .set_validity(now, now + std::chrono::hours(1))
            .set_subject_public_key_ed25519(key.public_key);
        bool saw_high_bit = false;
        for (int i = 0; i < 64; ++i) {
            auto built = builder.build(key, true);
            REQUIRE(built.success());
            const auto &serial = built.value().serial_number;
            REQUIRE(serial.size() == 16);
            if ((serial[0] & 0x80U) != 0) {
                saw_high_bit = true;
                // INTEGER tag, 17 content octets, 0x00 pad ahead of the serial
                CHECK(trust_test::contains_bytes(built.value().tbs_der, {0x02, 0x11, 0x00, serial[0], serial[1]}));
            }
            CHECK(trust_test::contains_bytes(built.value().tbs_der, der::encode_integer(serial)));
        }
        CHECK(saw_high_bit);
    }

    TEST_CASE("explicit serial keeps its high bit") {
        auto key = fresh_key();
        const auto now = std::chrono::system_clock::now();
        CertificateBuilder builder;
        builder.set_serial(Bytes{0x80, 0x01})
            .set_subject(trust_test::dn_from_string("CN=Self"))
            .set_validity(now, now + std::chrono::hours(1))
            .set_subject_public_key_ed25519(key.public_key);
        auto built = builder.build(key, true);
        REQUIRE(built.success());
        CHECK(built.value().serial_number == Bytes{0x80, 0x01});
        CHECK(trust_test::contains_bytes(built.value().tbs_der, {0x02, 0x03, 0x00, 0x80, 0x01}));
    }

    TEST_CASE("unavailable libsodium surfaces as AlgorithmUnavailable") {
        auto key = fresh_key();
        const auto now = std::chrono::system_clock::now();
        trust_test::SodiumOutage outage;

        SUBCASE("key generation") {
            auto keys = generate_ed25519_keypair();
            REQUIRE_FALSE(keys.success());
            CHECK(keys.error().crypto == trustlock::CryptoFailureKind::AlgorithmUnavailable);
        }
        SUBCASE("signing") {
            auto sig = sign_ed25519(Bytes{0x01, 0x02}, key.private_key);
            REQUIRE_FALSE(sig.success());
            CHECK(sig.code() == trustlock::ErrorCode::CryptoFailure);
            CHECK(sig.error().crypto == trustlock::CryptoFailureKind::AlgorithmUnavailable);
        }
        SUBCASE("random serial") {
            CertificateBuilder builder;
            builder.set_subject(trust_test::dn_from_string("CN=Self"))
                .set_validity(now, now + std::chrono::hours(1))
                .set_subject_public_key_ed25519(key.public_key);
            auto built = builder.build(key, true);
            REQUIRE_FALSE(built.success());
            CHECK(built.error().crypto == trustlock::CryptoFailureKind::AlgorithmUnavailable);
        }
        SUBCASE("verification") {
            CHECK_FALSE(verify_ed25519(Bytes{0x01}, Bytes(64, 0x00), key.public_key));
        }
    }

    TEST_CASE("missing inputs are encoding failures") {
        auto key = fresh_key();
        auto dn = trust_test::dn_from_string("CN=Self");
        const auto now = std::chrono::system_clock::now();

        SUBCASE("no subject") {
            CertificateBuilder builder;
            builder.set_validity(now, now + std::chrono::hours(1)).set_subject_public_key_ed25519(key.public_key);
            auto built = builder.build(key, true);
            REQUIRE_FALSE(built.success());
            CHECK(built.code() == trustlock::ErrorCode::CryptoFailure);
            CHECK(built.error().crypto == trustlock::CryptoFailureKind::EncodingFailed);
        }
        SUBCASE("no issuer on a non self-signed certificate") {
            CertificateBuilder builder;
            builder.set_subject(dn)
                .set_validity(now, now + std::chrono::hours(1))
                .set_subject_public_key_ed25519(key.public_key);
            CHECK_FALSE(builder.build(key).success());
        }
        SUBCASE("inverted validity") {
            CertificateBuilder builder;
            builder.set_subject(dn)
                .set_validity(now, now - std::chrono::hours(1))
                .set_subject_public_key_ed25519(key.public_key);
            CHECK_FALSE(builder.build(key, true).success());
        }
    }

    TEST_CASE("malformed signing key is a signing failure") {
        auto key = fresh_key();
        auto dn = trust_test::dn_from_string("CN=Self");
        const auto now = std::chrono::system_clock::now();
        CertificateBuilder builder;
        builder.set_subject(dn)
            .set_validity(now, now + std::chrono::hours(1))
            .set_subject_public_key_ed25519(key.public_key);
        KeyPair broken{key.public_key, Bytes(10, 0x00)};
        auto built = builder.build(broken, true);
        REQUIRE_FALSE(built.success());
        CHECK(built.error().crypto == trustlock::CryptoFailureKind::SigningFailed);
    }

    TEST_CASE("pem wraps at 64 columns") {
        Bytes der(100, 0x5A);
        auto pem = pem_encode("CERTIFICATE", der);
        CHECK(pem.rfind("-----BEGIN CERTIFICATE-----\n", 0) == 0);
        CHECK(pem.find("-----END CERTIFICATE-----\n") != std::string::npos);
        auto first_line_end = pem.find('\n', 28);
        CHECK(first_line_end - 28 == 64);
    }
}

TEST_SUITE("cert/crl_builder") {
    TEST_CASE("signed CRL lists revoked serials with reason codes") {
        auto ca_key = fresh_key();
        auto issuer = trust_test::dn_from_string("CN=Test CA");
        const auto now = std::chrono::system_clock::now();

        CrlBuilder builder;
        builder.set_issuer(issuer)
            .set_this_update(now)
            .set_next_update(now + std::chrono::hours(24))
            .add_revoked(Bytes{0x11, 0x22}, now, CrlReason::KeyCompromise)
            .add_revoked(Bytes{0x33, 0x44}, now, CrlReason::CessationOfOperation);
        auto crl = builder.build(ca_key);
        REQUIRE(crl.success());

        CHECK(crl.value().revoked.size() == 2);
        CHECK(trust_test::contains_bytes(crl.value().der, {0x02, 0x02, 0x11, 0x22}));
        CHECK(trust_test::contains_bytes(crl.value().der, {0x02, 0x02, 0x33, 0x44}));
        // reasonCode extension values: ENUMERATED 1 and ENUMERATED 5
        CHECK(trust_test::contains_bytes(crl.value().der, {0x04, 0x03, 0x0A, 0x01, 0x01}));
        CHECK(trust_test::contains_bytes(crl.value().der, {0x04, 0x03, 0x0A, 0x01, 0x05}));
        CHECK(verify_ed25519(crl.value().tbs_der, crl.value().signature, ca_key.public_key));
    }

    TEST_CASE("entry without a reason carries no entry extensions") {
        auto ca_key = fresh_key();
        const auto jan_2024 = std::chrono::system_clock::from_time_t(1704067200);
        RevokedCertificate entry;
        entry.serial_number = Bytes{0x55};
        entry.revocation_date = jan_2024;

        CrlBuilder builder;
        builder.set_issuer(trust_test::dn_from_string("CN=Test CA")).set_this_update(jan_2024).add_revoked(entry);
        auto crl = builder.build(ca_key);
        REQUIRE(crl.success());
        // SEQUENCE { INTEGER 0x55, UTCTime 240101000000Z } with nothing after the date
        Bytes expected{0x30, 0x12, 0x02, 0x01, 0x55, 0x17, 0x0D};
        const std::string date = "240101000000Z";
        expected.insert(expected.end(), date.begin(), date.end());
        CHECK(trust_test::contains_bytes(crl.value().der, expected));
        CHECK_FALSE(trust_test::contains_bytes(crl.value().der, {0x06, 0x03, 0x55, 0x1D, 0x15}));
    }

    TEST_CASE("empty CRL is valid; missing issuer is not") {
        auto ca_key = fresh_key();
        CrlBuilder empty;
        empty.set_issuer(trust_test::dn_from_string("CN=Test CA")).set_this_update(std::chrono::system_clock::now());
        CHECK(empty.build(ca_key).success());

        CrlBuilder no_issuer;
        no_issuer.set_this_update(std::chrono::system_clock::now());
        auto result = no_issuer.build(ca_key);
        REQUIRE_FALSE(result.success());
        CHECK(result.error().crypto == trustlock::CryptoFailureKind::EncodingFailed);
    }
}
