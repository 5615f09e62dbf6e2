#include <trustlock/device/mac_address.hpp>

#include <cctype>

#include <trustlock/utils/common.hpp>

namespace trustlock::mac {

    namespace {

        constexpr size_t kOctets = 6;
        constexpr size_t kFormattedLength = kOctets * 3 - 1;

        bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

    } // namespace

    bool is_valid(std::string_view mac) {
        if (mac.size() != kFormattedLength) {
            return false;
        }
        for (size_t i = 0; i < mac.size(); ++i) {
            if (i % 3 == 2) {
                if (mac[i] != ':' && mac[i] != '-') {
                    return false;
                }
            } else if (!is_hex(mac[i])) {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> canonicalize(std::string_view mac) {
        if (!is_valid(mac)) {
            return std::nullopt;
        }
        return utils::Common::to_upper(mac);
    }

    std::string strip_delimiters(std::string_view mac) {
        std::string out;
        out.reserve(mac.size());
        for (char c : mac) {
            if (c == ':' || c == '-') {
                continue;
            }
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        return out;
    }

    bool equals(std::string_view a, std::string_view b) { return utils::Common::iequals(a, b); }

} // namespace trustlock::mac
