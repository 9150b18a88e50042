#include "payload/Sanitizer.hpp"

#include <cctype>

namespace jp::payload
{

std::string sanitize_payload(std::string_view raw)
{
    std::string cleaned;
    cleaned.reserve(raw.size() + 3);
    for (char ch : raw)
    {
        auto const byte = static_cast<unsigned char>(ch);
        if (byte < 0x80 && std::isalnum(byte))
        {
            cleaned.push_back(ch);
        }
        else if (ch == '-' || ch == '+')
        {
            cleaned.push_back('+');
        }
        else if (ch == '_')
        {
            cleaned.push_back('/');
        }
    }
    while (cleaned.size() % 4 != 0)
    {
        cleaned.push_back('=');
    }
    return cleaned;
}

} // namespace jp::payload
