#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace trustlock::mac {

    // Six hex octets; each separator is ':' or '-' independently
    bool is_valid(std::string_view mac);

    // Uppercase form keeping the original delimiters, nullopt when invalid
    std::optional<std::string> canonicalize(std::string_view mac);

    // Uppercase hex digits only, as placed in certificate subjects
    std::string strip_delimiters(std::string_view mac);

    bool equals(std::string_view a, std::string_view b);

} // namespace trustlock::mac
