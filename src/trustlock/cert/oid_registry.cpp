#include <trustlock/cert/oid_registry.hpp>

#include <array>
#include <span>
#include <utility>

namespace trustlock::cert {

    namespace {

        template <size_t N> using OidArray = std::array<uint32_t, N>;

        template <typename Enum, size_t N>
        using OidTable = std::array<std::pair<Enum, std::span<const uint32_t>>, N>;

        template <typename Enum, size_t N> Enum lookup_enum(const Oid &oid, const OidTable<Enum, N> &table, Enum unknown) {
            for (const auto &[value, pattern] : table) {
                if (oid.nodes.size() != pattern.size()) {
                    continue;
                }
                bool match = true;
                for (size_t i = 0; i < pattern.size(); ++i) {
                    if (oid.nodes[i] != pattern[i]) {
                        match = false;
                        break;
                    }
                }
                if (match) {
                    return value;
                }
            }
            return unknown;
        }

        template <typename Enum, size_t N> std::optional<Oid> lookup_oid(Enum id, const OidTable<Enum, N> &table) {
            for (const auto &[value, pattern] : table) {
                if (value == id) {
                    return Oid{std::vector<uint32_t>(pattern.begin(), pattern.end())};
                }
            }
            return std::nullopt;
        }

        constexpr OidArray<4> kOidEd25519{1, 3, 101, 112};

        constexpr OidTable<SignatureAlgorithmId, 1> kSignatureAlgorithms = {
            std::pair{SignatureAlgorithmId::Ed25519, std::span<const uint32_t>(kOidEd25519)},
        };

        constexpr OidArray<4> kOidBasicConstraints{2, 5, 29, 19};
        constexpr OidArray<4> kOidKeyUsage{2, 5, 29, 15};
        constexpr OidArray<4> kOidExtendedKeyUsage{2, 5, 29, 37};
        constexpr OidArray<4> kOidAuthorityKeyId{2, 5, 29, 35};
        constexpr OidArray<4> kOidSubjectKeyId{2, 5, 29, 14};

        constexpr OidTable<ExtensionId, 5> kExtensionOids = {
            std::pair{ExtensionId::BasicConstraints, std::span<const uint32_t>(kOidBasicConstraints)},
            std::pair{ExtensionId::KeyUsage, std::span<const uint32_t>(kOidKeyUsage)},
            std::pair{ExtensionId::ExtendedKeyUsage, std::span<const uint32_t>(kOidExtendedKeyUsage)},
            std::pair{ExtensionId::AuthorityKeyIdentifier, std::span<const uint32_t>(kOidAuthorityKeyId)},
            std::pair{ExtensionId::SubjectKeyIdentifier, std::span<const uint32_t>(kOidSubjectKeyId)},
        };

        constexpr OidArray<9> kOidServerAuth{1, 3, 6, 1, 5, 5, 7, 3, 1};
        constexpr OidArray<9> kOidClientAuth{1, 3, 6, 1, 5, 5, 7, 3, 2};

        constexpr OidTable<KeyPurposeId, 2> kKeyPurposeOids = {
            std::pair{KeyPurposeId::ServerAuth, std::span<const uint32_t>(kOidServerAuth)},
            std::pair{KeyPurposeId::ClientAuth, std::span<const uint32_t>(kOidClientAuth)},
        };

        constexpr OidArray<4> kOidReasonCode{2, 5, 29, 21};

        constexpr OidTable<CrlEntryExtensionId, 1> kCrlEntryExtensionOids = {
            std::pair{CrlEntryExtensionId::ReasonCode, std::span<const uint32_t>(kOidReasonCode)},
        };

    } // namespace

    SignatureAlgorithmId find_sig_alg_by_oid(const Oid &oid) {
        return lookup_enum(oid, kSignatureAlgorithms, SignatureAlgorithmId::Unknown);
    }

    ExtensionId find_extension_by_oid(const Oid &oid) { return lookup_enum(oid, kExtensionOids, ExtensionId::Unknown); }

    KeyPurposeId find_key_purpose_by_oid(const Oid &oid) {
        return lookup_enum(oid, kKeyPurposeOids, KeyPurposeId::Unknown);
    }

    std::optional<Oid> oid_for_signature(SignatureAlgorithmId id) { return lookup_oid(id, kSignatureAlgorithms); }

    std::optional<Oid> oid_for_extension(ExtensionId id) { return lookup_oid(id, kExtensionOids); }

    std::optional<Oid> oid_for_key_purpose(KeyPurposeId id) { return lookup_oid(id, kKeyPurposeOids); }

    std::optional<Oid> oid_for_crl_entry_extension(CrlEntryExtensionId id) {
        return lookup_oid(id, kCrlEntryExtensionOids);
    }

} // namespace trustlock::cert
