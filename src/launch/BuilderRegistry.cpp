#include "launch/BuilderRegistry.hpp"

#include <format>
#include <utility>

namespace jp::launch
{

namespace
{
// Payload urls must never be parsed as player options.
constexpr char const kEndOfOptions[] = "--";

std::string path_to_utf8(std::filesystem::path const &path)
{
    auto value = path.u8string();
    return std::string(value.begin(), value.end());
}
} // namespace

ArgumentVector build_mpv_arguments(std::filesystem::path const &executable,
                                   payload::PlaybackInstruction const &instruction)
{
    ArgumentVector args;
    args.push_back(path_to_utf8(executable));
    if (instruction.profile && !instruction.profile->empty())
    {
        args.push_back(std::format("--profile={}", *instruction.profile));
    }
    if (instruction.geometry && !instruction.geometry->empty())
    {
        args.push_back(std::format("--geometry={}", *instruction.geometry));
    }
    if (instruction.title && !instruction.title->empty())
    {
        args.push_back(std::format("--force-media-title={}", *instruction.title));
    }
    if (instruction.subtitle_url && !instruction.subtitle_url->empty())
    {
        args.push_back(std::format("--sub-file={}", *instruction.subtitle_url));
    }
    if (instruction.user_agent && !instruction.user_agent->empty())
    {
        args.push_back(std::format("--user-agent={}", *instruction.user_agent));
    }
    args.push_back(kEndOfOptions);
    args.push_back(instruction.url);
    return args;
}

ArgumentVector build_vlc_arguments(std::filesystem::path const &executable,
                                   payload::PlaybackInstruction const &instruction)
{
    return {path_to_utf8(executable), kEndOfOptions, instruction.url};
}

BuilderRegistry const &BuilderRegistry::instance()
{
    static BuilderRegistry const registry;
    return registry;
}

BuilderRegistry::BuilderRegistry()
{
    register_builders();
}

void BuilderRegistry::register_builders()
{
    auto add = [this](std::string target, ArgumentBuilder builder)
    { builders_.emplace(std::move(target), std::move(builder)); };

    add("mpv", build_mpv_arguments);
    add("vlc", build_vlc_arguments);
}

ArgumentBuilder const *BuilderRegistry::find(std::string_view target) const
{
    auto it = builders_.find(target);
    if (it == builders_.end())
    {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> BuilderRegistry::targets() const
{
    std::vector<std::string> result;
    result.reserve(builders_.size());
    for (auto const &entry : builders_)
    {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace jp::launch
