#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace jp::payload
{

struct SchemeUri
{
    // Lower-cased.
    std::string scheme;
    std::string payload;
};

// RFC 3986 scheme name: a letter followed by letters, digits, '+', '-', '.'.
bool is_valid_scheme_name(std::string_view scheme);

// Schemes compare case-insensitively; every stored or looked-up scheme goes
// through this first.
std::string normalize_scheme_name(std::string_view scheme);

// Splits "<scheme>://<payload>". Returns nullopt when the separator is
// missing or the scheme is not a valid URI scheme name.
std::optional<SchemeUri> split_scheme_uri(std::string_view raw);

} // namespace jp::payload
