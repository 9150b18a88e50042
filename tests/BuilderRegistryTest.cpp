#include "launch/BuilderRegistry.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using jp::launch::ArgumentVector;
using jp::launch::BuilderRegistry;
using jp::payload::PlaybackInstruction;

TEST_CASE("mpv builder places option flags ahead of the url")
{
    PlaybackInstruction instruction;
    instruction.target = "mpv";
    instruction.url = "http://x/a.mkv";
    instruction.profile = "multi";
    instruction.geometry = "50%x50%+0+0";
    instruction.title = "A title";
    instruction.subtitle_url = "http://x/a.srt";
    instruction.user_agent = "Agent/1.0";

    auto args = jp::launch::build_mpv_arguments("/usr/bin/mpv", instruction);
    ArgumentVector const expected = {
        "/usr/bin/mpv",
        "--profile=multi",
        "--geometry=50%x50%+0+0",
        "--force-media-title=A title",
        "--sub-file=http://x/a.srt",
        "--user-agent=Agent/1.0",
        "--",
        "http://x/a.mkv",
    };
    CHECK(args == expected);
}

TEST_CASE("mpv builder skips absent and empty options")
{
    PlaybackInstruction instruction;
    instruction.target = "mpv";
    instruction.url = "http://x/a.mkv";
    instruction.title = "";

    auto args = jp::launch::build_mpv_arguments("/usr/bin/mpv", instruction);
    CHECK(args == ArgumentVector{"/usr/bin/mpv", "--", "http://x/a.mkv"});
}

TEST_CASE("vlc builder emits only the url after the option terminator")
{
    PlaybackInstruction instruction;
    instruction.target = "vlc";
    instruction.url = "http://x/a.mkv";
    instruction.geometry = "50%x50%+0+0";
    instruction.profile = "multi";

    auto args = jp::launch::build_vlc_arguments("/usr/bin/vlc", instruction);
    CHECK(args == ArgumentVector{"/usr/bin/vlc", "--", "http://x/a.mkv"});
}

TEST_CASE("urls that look like options stay behind the terminator")
{
    PlaybackInstruction instruction;
    instruction.target = "mpv";
    instruction.url = "--stream-record=/home/u/.bashrc";
    instruction.geometry = "50%x50%+0+0";

    auto mpv = jp::launch::build_mpv_arguments("/usr/bin/mpv", instruction);
    REQUIRE(mpv.size() == 4);
    CHECK(mpv[1] == "--geometry=50%x50%+0+0");
    CHECK(mpv[2] == "--");
    CHECK(mpv[3] == "--stream-record=/home/u/.bashrc");

    instruction.url = "--play-and-exit";
    auto vlc = jp::launch::build_vlc_arguments("/usr/bin/vlc", instruction);
    CHECK(vlc == ArgumentVector{"/usr/bin/vlc", "--", "--play-and-exit"});
}

TEST_CASE("registry resolves known targets only")
{
    auto const &registry = BuilderRegistry::instance();
    CHECK(registry.find("mpv") != nullptr);
    CHECK(registry.find("vlc") != nullptr);
    CHECK(registry.find("potplayer") == nullptr);
    CHECK(registry.find("") == nullptr);
    CHECK(registry.targets() == std::vector<std::string>{"mpv", "vlc"});
    CHECK(&registry == &BuilderRegistry::instance());
}

TEST_CASE("registry entries invoke their builder")
{
    PlaybackInstruction instruction;
    instruction.target = "mpv";
    instruction.url = "u";
    instruction.geometry = "g";
    auto const *builder = BuilderRegistry::instance().find("mpv");
    REQUIRE(builder != nullptr);
    CHECK((*builder)("mpv", instruction) ==
          ArgumentVector{"mpv", "--geometry=g", "--", "u"});
}
