#include <trustlock/ca/signing_context.hpp>

#include <trustlock/cert/pem.hpp>
#include <trustlock/core/log.hpp>

namespace trustlock::ca {

    using MaterialResult = Result<std::shared_ptr<const CaMaterial>>;

    CaSigningContext::CaSigningContext(TrustConfig config) : config_(std::move(config)) {}

    BoolResult CaSigningContext::initialize() {
        auto result = material();
        if (!result.success()) {
            return BoolResult::failure(result.error());
        }
        return BoolResult::ok(true);
    }

    bool CaSigningContext::initialized() const noexcept { return material_.load() != nullptr; }

    MaterialResult CaSigningContext::material() {
        if (auto existing = material_.load()) {
            return MaterialResult::ok(std::move(existing));
        }

        std::lock_guard<std::mutex> lock(init_mutex_);
        if (auto existing = material_.load()) {
            return MaterialResult::ok(std::move(existing));
        }

        auto created = create_material();
        if (!created.success()) {
            log::logger()->critical("CA initialisation failed ({}): {}",
                                    to_string(created.error().crypto.value_or(CryptoFailureKind::KeyGenerationFailed)),
                                    created.error().message);
            return created;
        }
        material_.store(created.value());
        log::logger()->info("CA initialised: {} ({})", created.value()->issuer.to_string(),
                            cert::kKeyAlgorithmName);
        return created;
    }

    MaterialResult CaSigningContext::create_material() const {
        auto issuer = cert::DistinguishedName::from_string(config_.ca_distinguished_name);
        if (!issuer.success) {
            return MaterialResult::failure(
                Error::crypto_failure(CryptoFailureKind::EncodingFailed, "CA distinguished name: " + issuer.error));
        }

        auto keys = cert::generate_ed25519_keypair();
        if (!keys.success()) {
            return MaterialResult::failure(keys.error());
        }

        auto material = std::make_shared<CaMaterial>();
        material->key_pair = std::move(keys).value();
        material->issuer = issuer.value;
        material->key_identifier = cert::key_identifier(material->key_pair.public_key);

        const auto now = std::chrono::system_clock::now();
        cert::CertificateBuilder builder;
        builder.set_subject(material->issuer)
            .set_validity(now, now + std::chrono::hours(24) * config_.ca_validity_days)
            .set_subject_public_key_ed25519(material->key_pair.public_key)
            .set_basic_constraints(true, 0U)
            .set_key_usage(cert::key_usage::KeyCertSign | cert::key_usage::CRLSign)
            .set_subject_key_identifier(material->key_identifier)
            .set_authority_key_identifier(material->key_identifier);

        auto built = builder.build(material->key_pair, true);
        if (!built.success()) {
            return MaterialResult::failure(built.error());
        }
        material->certificate = std::move(built).value();
        material->certificate_pem = cert::pem_encode("CERTIFICATE", material->certificate.der);
        return MaterialResult::ok(std::shared_ptr<const CaMaterial>(std::move(material)));
    }

} // namespace trustlock::ca
