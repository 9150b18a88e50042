#include "payload/SchemeUri.hpp"

#include <algorithm>
#include <cctype>

namespace jp::payload
{

namespace
{
constexpr std::string_view kSeparator = "://";
} // namespace

bool is_valid_scheme_name(std::string_view scheme)
{
    if (scheme.empty() ||
        !std::isalpha(static_cast<unsigned char>(scheme.front())))
    {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(),
                       [](char ch)
                       {
                           auto const byte = static_cast<unsigned char>(ch);
                           return byte < 0x80 &&
                                  (std::isalnum(byte) || ch == '+' ||
                                   ch == '-' || ch == '.');
                       });
}

std::string normalize_scheme_name(std::string_view scheme)
{
    std::string normalized;
    normalized.reserve(scheme.size());
    for (char ch : scheme)
    {
        normalized.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

std::optional<SchemeUri> split_scheme_uri(std::string_view raw)
{
    auto separator = raw.find(kSeparator);
    if (separator == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto scheme = raw.substr(0, separator);
    if (!is_valid_scheme_name(scheme))
    {
        return std::nullopt;
    }
    SchemeUri result;
    result.scheme = normalize_scheme_name(scheme);
    result.payload = std::string(raw.substr(separator + kSeparator.size()));
    return result;
}

} // namespace jp::payload
