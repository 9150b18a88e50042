#pragma once

#include <string>
#include <string_view>

namespace jp::payload
{

// Maps the text after "<scheme>://" onto the padded standard Base64
// alphabet. URL-safe '-' and '_' become '+' and '/', a bare '/' and every
// character outside the alphabet are dropped, and '=' is appended until the
// length is a multiple of four.
//
// Known limitation: a bare '/' is assumed to be a trailing separator added
// by the browser, so a producer that emits standard (not URL-safe) Base64
// loses data here.
std::string sanitize_payload(std::string_view raw);

} // namespace jp::payload
