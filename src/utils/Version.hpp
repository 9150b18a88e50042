#pragma once

#ifndef JP_BUILD_VERSION
#define JP_BUILD_VERSION "0.0.0"
#endif

namespace jp::version
{

// Compile-time helpers derived from JP_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = JP_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "jelly-player-handler " JP_BUILD_VERSION;

} // namespace jp::version
