#include "app/HandlerMain.hpp"

#include <doctest/doctest.h>

using jp::app::CommandMode;
using jp::app::parse_command_line;

TEST_CASE("no arguments prints usage")
{
    char const *argv[] = {"jelly-player-handler"};
    CHECK(parse_command_line(1, argv).mode == CommandMode::Usage);
}

TEST_CASE("a single argument is treated as the uri")
{
    char const *argv[] = {"jelly-player-handler", "jelly-player://abc"};
    auto command = parse_command_line(2, argv);
    CHECK(command.mode == CommandMode::Handle);
    CHECK(command.uri == "jelly-player://abc");
}

TEST_CASE("version flag")
{
    char const *argv[] = {"jelly-player-handler", "--version"};
    CHECK(parse_command_line(2, argv).mode == CommandMode::Version);
}

TEST_CASE("install takes a scheme, an optional target and the player path")
{
    char const *argv[] = {"jelly-player-handler", "--install", "--scheme",
                          "jelly-player", "/usr/bin/mpv"};
    auto command = parse_command_line(5, argv);
    CHECK(command.mode == CommandMode::Install);
    CHECK(command.scheme == "jelly-player");
    CHECK(command.target == "mpv");
    CHECK(command.player_path == std::filesystem::path("/usr/bin/mpv"));

    char const *with_target[] = {"jelly-player-handler", "--install",
                                 "--target", "vlc", "--scheme", "vlc-play",
                                 "/usr/bin/vlc"};
    command = parse_command_line(7, with_target);
    CHECK(command.mode == CommandMode::Install);
    CHECK(command.target == "vlc");
    CHECK(command.scheme == "vlc-play");
}

TEST_CASE("install without a path or scheme is invalid")
{
    char const *no_path[] = {"jelly-player-handler", "--install", "--scheme",
                             "jelly-player"};
    auto command = parse_command_line(4, no_path);
    CHECK(command.mode == CommandMode::Invalid);
    CHECK_FALSE(command.error.empty());

    char const *no_scheme[] = {"jelly-player-handler", "--install",
                               "/usr/bin/mpv"};
    CHECK(parse_command_line(3, no_scheme).mode == CommandMode::Invalid);

    char const *dangling[] = {"jelly-player-handler", "--install", "--scheme"};
    CHECK(parse_command_line(3, dangling).mode == CommandMode::Invalid);

    char const *bad_scheme[] = {"jelly-player-handler", "--install", "--scheme",
                                "bad scheme", "/usr/bin/mpv"};
    CHECK(parse_command_line(5, bad_scheme).mode == CommandMode::Invalid);
}

TEST_CASE("uninstall needs only the scheme")
{
    char const *argv[] = {"jelly-player-handler", "--uninstall", "--scheme",
                          "jelly-player"};
    auto command = parse_command_line(4, argv);
    CHECK(command.mode == CommandMode::Uninstall);
    CHECK(command.scheme == "jelly-player");

    char const *extra[] = {"jelly-player-handler", "--uninstall", "--scheme",
                           "jelly-player", "/usr/bin/mpv"};
    CHECK(parse_command_line(5, extra).mode == CommandMode::Invalid);

    char const *unknown[] = {"jelly-player-handler", "--uninstall", "--force"};
    CHECK(parse_command_line(3, unknown).mode == CommandMode::Invalid);
}

TEST_CASE("scheme names from the command line are lower-cased")
{
    char const *install[] = {"jelly-player-handler", "--install", "--scheme",
                             "Jelly-Player", "/usr/bin/mpv"};
    auto command = parse_command_line(5, install);
    CHECK(command.mode == CommandMode::Install);
    CHECK(command.scheme == "jelly-player");

    char const *uninstall[] = {"jelly-player-handler", "--uninstall",
                               "--scheme", "MPV-Cinema"};
    CHECK(parse_command_line(4, uninstall).scheme == "mpv-cinema");
}
