#pragma once

#include <optional>
#include <string>

namespace jp::payload
{

// One "play this URL with these options" unit decoded from a payload.
struct PlaybackInstruction
{
    std::string target;
    std::string url;
    std::optional<std::string> profile;
    std::optional<std::string> geometry;
    std::optional<std::string> title;
    std::optional<std::string> subtitle_url;
    std::optional<std::string> user_agent;

    bool operator==(PlaybackInstruction const &) const = default;
};

} // namespace jp::payload
