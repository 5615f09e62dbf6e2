#include <trustlock/cert/distinguished_name.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

#include <trustlock/cert/asn1_writer.hpp>

namespace trustlock::cert {

    namespace {

        std::optional<Oid> oid_from_attribute(DistinguishedNameAttribute attribute) {
            switch (attribute) {
            case DistinguishedNameAttribute::CommonName:
                return Oid{{2, 5, 4, 3}};
            case DistinguishedNameAttribute::CountryName:
                return Oid{{2, 5, 4, 6}};
            case DistinguishedNameAttribute::OrganizationName:
                return Oid{{2, 5, 4, 10}};
            case DistinguishedNameAttribute::OrganizationalUnitName:
                return Oid{{2, 5, 4, 11}};
            case DistinguishedNameAttribute::StateOrProvinceName:
                return Oid{{2, 5, 4, 8}};
            case DistinguishedNameAttribute::LocalityName:
                return Oid{{2, 5, 4, 7}};
            case DistinguishedNameAttribute::SerialNumber:
                return Oid{{2, 5, 4, 5}};
            case DistinguishedNameAttribute::Unknown:
                break;
            }
            return std::nullopt;
        }

        const char *attribute_name(DistinguishedNameAttribute attribute) {
            switch (attribute) {
            case DistinguishedNameAttribute::CommonName:
                return "CN";
            case DistinguishedNameAttribute::CountryName:
                return "C";
            case DistinguishedNameAttribute::OrganizationName:
                return "O";
            case DistinguishedNameAttribute::OrganizationalUnitName:
                return "OU";
            case DistinguishedNameAttribute::StateOrProvinceName:
                return "ST";
            case DistinguishedNameAttribute::LocalityName:
                return "L";
            case DistinguishedNameAttribute::SerialNumber:
                return "SERIALNUMBER";
            case DistinguishedNameAttribute::Unknown:
                break;
            }
            return "OID";
        }

        std::optional<DistinguishedNameAttribute> attribute_from_string(std::string_view token) {
            std::string upper(token);
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (upper == "CN") {
                return DistinguishedNameAttribute::CommonName;
            }
            if (upper == "C") {
                return DistinguishedNameAttribute::CountryName;
            }
            if (upper == "O") {
                return DistinguishedNameAttribute::OrganizationName;
            }
            if (upper == "OU") {
                return DistinguishedNameAttribute::OrganizationalUnitName;
            }
            if (upper == "ST" || upper == "S") {
                return DistinguishedNameAttribute::StateOrProvinceName;
            }
            if (upper == "L") {
                return DistinguishedNameAttribute::LocalityName;
            }
            if (upper == "SERIALNUMBER") {
                return DistinguishedNameAttribute::SerialNumber;
            }
            return std::nullopt;
        }

        bool is_printable_string(std::string_view str) {
            for (char c : str) {
                if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
                    continue;
                }
                switch (c) {
                case ' ':
                case '\'':
                case '(':
                case ')':
                case '+':
                case ',':
                case '-':
                case '.':
                case '/':
                case ':':
                case '=':
                case '?':
                    continue;
                default:
                    return false;
                }
            }
            return true;
        }

        std::vector<uint8_t> encode_directory_string(const AttributeTypeAndValue &attr) {
            // countryName and serialNumber are PrintableString only (X.520)
            if (attr.attribute == DistinguishedNameAttribute::CountryName ||
                attr.attribute == DistinguishedNameAttribute::SerialNumber || is_printable_string(attr.value)) {
                return der::encode_string(ASN1Tag::PrintableString, attr.value);
            }
            return der::encode_string(ASN1Tag::UTF8String, attr.value);
        }

        std::string_view trim(std::string_view view) {
            while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) {
                view.remove_prefix(1);
            }
            while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back()))) {
                view.remove_suffix(1);
            }
            return view;
        }

    } // namespace

    DistinguishedName::Result DistinguishedName::from_string(std::string_view input) {
        DistinguishedName dn;
        size_t start = 0;
        while (start <= input.size()) {
            size_t end = input.find(',', start);
            if (end == std::string_view::npos) {
                end = input.size();
            }
            auto component = trim(input.substr(start, end - start));
            if (!component.empty()) {
                RelativeDistinguishedName rdn;
                size_t sub_start = 0;
                while (true) {
                    size_t sub_end = component.find('+', sub_start);
                    auto pair = trim(component.substr(
                        sub_start, sub_end == std::string_view::npos ? std::string_view::npos : sub_end - sub_start));
                    auto eq_pos = pair.find('=');
                    if (eq_pos == std::string_view::npos) {
                        return Result::failure("invalid DN component: " + std::string(pair));
                    }
                    auto attribute = attribute_from_string(trim(pair.substr(0, eq_pos)));
                    if (!attribute.has_value()) {
                        return Result::failure("unsupported DN attribute: " + std::string(trim(pair.substr(0, eq_pos))));
                    }
                    auto value = trim(pair.substr(eq_pos + 1));
                    if (value.empty()) {
                        return Result::failure("empty DN attribute value");
                    }
                    if (*attribute == DistinguishedNameAttribute::CountryName && value.size() != 2) {
                        return Result::failure("country must be a two-letter code");
                    }
                    AttributeTypeAndValue atv{};
                    atv.attribute = *attribute;
                    atv.oid = *oid_from_attribute(*attribute);
                    atv.value = std::string(value);
                    if (atv.attribute == DistinguishedNameAttribute::CountryName) {
                        std::transform(atv.value.begin(), atv.value.end(), atv.value.begin(),
                                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                    }
                    rdn.push_back(std::move(atv));
                    if (sub_end == std::string_view::npos) {
                        break;
                    }
                    sub_start = sub_end + 1;
                }
                dn.rdns_.push_back(std::move(rdn));
            }
            if (end == input.size()) {
                break;
            }
            start = end + 1;
        }
        if (dn.rdns_.empty()) {
            return Result::failure("DN string empty");
        }
        dn.encode();
        return Result::ok(std::move(dn));
    }

    DistinguishedName::Result DistinguishedName::from_attributes(
        const std::vector<std::pair<DistinguishedNameAttribute, std::string>> &attributes) {
        DistinguishedName dn;
        for (const auto &[attribute, value] : attributes) {
            auto oid = oid_from_attribute(attribute);
            if (!oid.has_value()) {
                return Result::failure("unsupported DN attribute");
            }
            if (value.empty()) {
                return Result::failure(std::string("empty value for ") + attribute_name(attribute));
            }
            if (attribute == DistinguishedNameAttribute::SerialNumber && !is_printable_string(value)) {
                return Result::failure("serialNumber must be a PrintableString");
            }
            AttributeTypeAndValue atv{};
            atv.attribute = attribute;
            atv.oid = *oid;
            atv.value = value;
            dn.rdns_.push_back(RelativeDistinguishedName{std::move(atv)});
        }
        if (dn.rdns_.empty()) {
            return Result::failure("DN has no attributes");
        }
        dn.encode();
        return Result::ok(std::move(dn));
    }

    void DistinguishedName::encode() {
        std::vector<std::vector<uint8_t>> rdn_blocks;
        for (const auto &rdn : rdns_) {
            std::vector<std::vector<uint8_t>> atvs;
            for (const auto &atv : rdn) {
                auto oid = der::encode_oid(atv.oid);
                auto value = encode_directory_string(atv);
                atvs.push_back(der::encode_sequence(der::concat({oid, value})));
            }
            rdn_blocks.push_back(der::encode_constructed(ASN1Tag::Set, der::concat(atvs)));
        }
        der_ = der::encode_sequence(der::concat(rdn_blocks));
    }

    std::optional<std::string> DistinguishedName::first(DistinguishedNameAttribute attribute) const {
        for (const auto &rdn : rdns_) {
            for (const auto &entry : rdn) {
                if (entry.attribute == attribute) {
                    return entry.value;
                }
            }
        }
        return std::nullopt;
    }

    std::string DistinguishedName::to_string() const {
        std::ostringstream oss;
        bool first_attr = true;
        for (const auto &rdn : rdns_) {
            for (const auto &entry : rdn) {
                if (!first_attr) {
                    oss << ", ";
                }
                first_attr = false;
                oss << attribute_name(entry.attribute) << "=" << entry.value;
            }
        }
        return oss.str();
    }

} // namespace trustlock::cert
