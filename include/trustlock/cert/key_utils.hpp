#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <trustlock/core/result.hpp>

namespace trustlock::cert {

    struct KeyPair {
        std::vector<uint8_t> public_key;
        std::vector<uint8_t> private_key; // libsodium layout: seed || public key
    };

    inline constexpr const char *kKeyAlgorithmName = "Ed25519";
    inline constexpr const char *kSignatureAlgorithmName = "Ed25519";

    Result<KeyPair> generate_ed25519_keypair();

    Result<std::vector<uint8_t>> sign_ed25519(const std::vector<uint8_t> &message,
                                              const std::vector<uint8_t> &private_key);

    bool verify_ed25519(const std::vector<uint8_t> &message, const std::vector<uint8_t> &signature,
                        const std::vector<uint8_t> &public_key);

    // SubjectPublicKeyInfo DER for a raw Ed25519 public key (RFC 8410)
    std::vector<uint8_t> spki_from_ed25519_public(const std::vector<uint8_t> &public_key);

    // Leftmost 160 bits of SHA-256 over the public key (RFC 7093 method 1)
    std::vector<uint8_t> key_identifier(const std::vector<uint8_t> &public_key);

} // namespace trustlock::cert
