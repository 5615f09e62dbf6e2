#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <trustlock/utils/common.hpp>

namespace trustlock::cert {

    namespace detail {

        constexpr std::string_view kBeginMarker = "-----BEGIN ";
        constexpr std::string_view kEndMarker = "-----END ";
        constexpr std::string_view kTrailer = "-----";
        constexpr size_t kLineWidth = 64;

    } // namespace detail

    // RFC 7468 textual encoding, 64 columns
    inline std::string pem_encode(std::string_view label, const std::vector<uint8_t> &der) {
        const auto body = utils::Common::to_base64(der);
        std::string out;
        out.reserve(body.size() + body.size() / detail::kLineWidth + 64);
        out.append(detail::kBeginMarker).append(label).append(detail::kTrailer).push_back('\n');
        for (size_t offset = 0; offset < body.size(); offset += detail::kLineWidth) {
            out.append(body, offset, detail::kLineWidth);
            out.push_back('\n');
        }
        out.append(detail::kEndMarker).append(label).append(detail::kTrailer).push_back('\n');
        return out;
    }

} // namespace trustlock::cert
