#pragma once

#include <optional>

#include <trustlock/cert/asn1_common.hpp>

namespace trustlock::cert {

    /**
     * Object identifiers used when building device certificates and CRLs.
     * Lookups go both ways so emitted structures can be checked in tests.
     */

    SignatureAlgorithmId find_sig_alg_by_oid(const Oid &oid);
    ExtensionId find_extension_by_oid(const Oid &oid);
    KeyPurposeId find_key_purpose_by_oid(const Oid &oid);

    std::optional<Oid> oid_for_signature(SignatureAlgorithmId id);
    std::optional<Oid> oid_for_extension(ExtensionId id);
    std::optional<Oid> oid_for_key_purpose(KeyPurposeId id);
    std::optional<Oid> oid_for_crl_entry_extension(CrlEntryExtensionId id);

} // namespace trustlock::cert
