#include "install/ProtocolRegistration.hpp"

#include <string>

#include <doctest/doctest.h>

TEST_CASE("desktop entry routes the scheme to the handler")
{
    auto contents = jp::install::desktop_entry_contents(
        "jelly-player", "/opt/jp/jelly-player-handler");
    CHECK(contents.rfind("[Desktop Entry]\n", 0) == 0);
    CHECK(contents.find("Exec=\"/opt/jp/jelly-player-handler\" %u\n") !=
          std::string::npos);
    CHECK(contents.find("MimeType=x-scheme-handler/jelly-player;\n") !=
          std::string::npos);
    CHECK(contents.find("NoDisplay=true\n") != std::string::npos);
}

TEST_CASE("desktop entry name is derived from the scheme")
{
    CHECK(jp::install::desktop_entry_name("mpv-cinema") ==
          "jelly-player-handler-mpv-cinema.desktop");
}

TEST_CASE("invalid scheme names are refused before touching the system")
{
    auto result = jp::install::register_scheme_handler("bad scheme", "/bin/true");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.message.empty());

    auto removal = jp::install::unregister_scheme_handler("");
    CHECK_FALSE(removal.success);
}

TEST_CASE("exec argument escapes desktop entry reserved characters")
{
    CHECK(jp::install::quote_exec_argument("/opt/jp/handler") ==
          "\"/opt/jp/handler\"");
    CHECK(jp::install::quote_exec_argument("/opt/we\"ird$dir/100%/h`x") ==
          R"("/opt/we\\"ird\\$dir/100%%/h\\`x")");
    CHECK(jp::install::quote_exec_argument("/opt/back\\slash") ==
          R"("/opt/back\\\\slash")");

    auto contents = jp::install::desktop_entry_contents(
        "jelly-player", "/home/u/100% media/jelly-player-handler");
    CHECK(contents.find(
              "Exec=\"/home/u/100%% media/jelly-player-handler\" %u\n") !=
          std::string::npos);
}

TEST_CASE("permission failures carry a hint")
{
    jp::install::RegistrationResult plain{false, false, "disk full"};
    CHECK(jp::install::describe_failure(plain) == "disk full");

    jp::install::RegistrationResult denied{false, true, "unable to store x"};
    auto text = jp::install::describe_failure(denied);
    CHECK(text.rfind("unable to store x (", 0) == 0);
    CHECK(text.size() > denied.message.size());
}
