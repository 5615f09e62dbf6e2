#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <trustlock/cert/asn1_common.hpp>

namespace trustlock::cert {

    enum class DistinguishedNameAttribute {
        Unknown = 0,
        CommonName,
        CountryName,
        OrganizationName,
        OrganizationalUnitName,
        StateOrProvinceName,
        LocalityName,
        SerialNumber
    };

    struct AttributeTypeAndValue {
        Oid oid{};
        DistinguishedNameAttribute attribute{DistinguishedNameAttribute::Unknown};
        std::string value;
    };

    using RelativeDistinguishedName = std::vector<AttributeTypeAndValue>;

    class DistinguishedName {
      public:
        struct Result;

        DistinguishedName() = default;

        // Parses "CN=..., O=..., OU=..." (RFC 4514 subset, '+' joins multi-valued RDNs)
        static Result from_string(std::string_view input);

        // One single-valued RDN per attribute, values taken verbatim
        static Result from_attributes(const std::vector<std::pair<DistinguishedNameAttribute, std::string>> &attributes);

        [[nodiscard]] const std::vector<uint8_t> &der() const noexcept { return der_; }
        [[nodiscard]] const std::vector<RelativeDistinguishedName> &rdns() const noexcept { return rdns_; }

        [[nodiscard]] std::optional<std::string> first(DistinguishedNameAttribute attribute) const;
        [[nodiscard]] std::string to_string() const;
        [[nodiscard]] bool empty() const noexcept { return rdns_.empty(); }

      private:
        void encode();

        std::vector<RelativeDistinguishedName> rdns_;
        std::vector<uint8_t> der_;
    };

    struct DistinguishedName::Result {
        bool success{};
        DistinguishedName value{};
        std::string error{};

        static Result failure(std::string message) { return Result{false, {}, std::move(message)}; }
        static Result ok(DistinguishedName value) { return Result{true, std::move(value), {}}; }
    };

} // namespace trustlock::cert
