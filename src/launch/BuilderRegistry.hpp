#pragma once

#include "payload/Instruction.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jp::launch
{

using ArgumentVector = std::vector<std::string>;
// argv[0] of the returned vector is the executable path; the url is always
// the last element, preceded by "--".
using ArgumentBuilder = std::function<ArgumentVector(
    std::filesystem::path const &, payload::PlaybackInstruction const &)>;

ArgumentVector build_mpv_arguments(std::filesystem::path const &executable,
                                   payload::PlaybackInstruction const &instruction);
ArgumentVector build_vlc_arguments(std::filesystem::path const &executable,
                                   payload::PlaybackInstruction const &instruction);

// Target identifier -> argument builder. Populated once, never mutated.
class BuilderRegistry
{
  public:
    static BuilderRegistry const &instance();

    ArgumentBuilder const *find(std::string_view target) const;
    std::vector<std::string> targets() const;

  private:
    BuilderRegistry();
    void register_builders();

    std::map<std::string, ArgumentBuilder, std::less<>> builders_;
};

} // namespace jp::launch
