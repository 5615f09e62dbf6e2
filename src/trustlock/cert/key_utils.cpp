#include <trustlock/cert/key_utils.hpp>

#include <sodium.h>

#include <trustlock/cert/asn1_writer.hpp>
#include <trustlock/cert/oid_registry.hpp>
#include <trustlock/utils/common.hpp>

namespace trustlock::cert {

    Result<KeyPair> generate_ed25519_keypair() {
        auto ready = utils::require_sodium("Ed25519 key generation");
        if (!ready.success()) {
            return Result<KeyPair>::failure(ready.error());
        }
        KeyPair pair;
        pair.public_key.resize(crypto_sign_ed25519_PUBLICKEYBYTES);
        pair.private_key.resize(crypto_sign_ed25519_SECRETKEYBYTES);
        if (crypto_sign_ed25519_keypair(pair.public_key.data(), pair.private_key.data()) != 0) {
            return Result<KeyPair>::failure(
                Error::crypto_failure(CryptoFailureKind::KeyGenerationFailed, "Ed25519 key generation failed"));
        }
        return Result<KeyPair>::ok(std::move(pair));
    }

    Result<std::vector<uint8_t>> sign_ed25519(const std::vector<uint8_t> &message,
                                              const std::vector<uint8_t> &private_key) {
        using SignatureResult = Result<std::vector<uint8_t>>;
        if (private_key.size() != crypto_sign_ed25519_SECRETKEYBYTES) {
            return SignatureResult::failure(
                Error::crypto_failure(CryptoFailureKind::SigningFailed, "Invalid Ed25519 private key size"));
        }
        auto ready = utils::require_sodium("Ed25519 signing");
        if (!ready.success()) {
            return SignatureResult::failure(ready.error());
        }
        std::vector<uint8_t> signature(crypto_sign_ed25519_BYTES);
        unsigned long long sig_len = 0;
        if (crypto_sign_ed25519_detached(signature.data(), &sig_len, message.data(), message.size(),
                                         private_key.data()) != 0) {
            return SignatureResult::failure(
                Error::crypto_failure(CryptoFailureKind::SigningFailed, "Ed25519 signing failed"));
        }
        signature.resize(sig_len);
        return SignatureResult::ok(std::move(signature));
    }

    bool verify_ed25519(const std::vector<uint8_t> &message, const std::vector<uint8_t> &signature,
                        const std::vector<uint8_t> &public_key) {
        if (signature.size() != crypto_sign_ed25519_BYTES || public_key.size() != crypto_sign_ed25519_PUBLICKEYBYTES) {
            return false;
        }
        if (!utils::sodium_available()) {
            return false;
        }
        return crypto_sign_ed25519_verify_detached(signature.data(), message.data(), message.size(),
                                                   public_key.data()) == 0;
    }

    std::vector<uint8_t> spki_from_ed25519_public(const std::vector<uint8_t> &public_key) {
        auto oid = oid_for_signature(SignatureAlgorithmId::Ed25519);
        std::vector<std::vector<uint8_t>> fields;
        fields.push_back(der::encode_sequence(der::encode_oid(*oid)));
        fields.push_back(der::encode_bit_string(ByteSpan(public_key.data(), public_key.size())));
        return der::encode_sequence(der::concat(fields));
    }

    std::vector<uint8_t> key_identifier(const std::vector<uint8_t> &public_key) {
        auto digest = utils::sha256(public_key);
        digest.resize(20);
        return digest;
    }

} // namespace trustlock::cert
