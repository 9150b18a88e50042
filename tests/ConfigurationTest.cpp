#include "config/HandlerConfig.hpp"
#include "TestUtils.hpp"
#include "utils/StateStore.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

TEST_CASE("defaults are used while the store is empty")
{
    auto temp_root = jp::tests::make_temp_root("config-defaults");
    jp::config::HandlerConfigStore store(temp_root / "settings.db");
    REQUIRE(store.is_valid());

    auto config = store.load(jp::config::default_handler_config(temp_root));
    CHECK_FALSE(config.log_enabled);
    CHECK(config.log_path == temp_root / jp::config::kLogFileName);
    CHECK(config.launch_interval ==
          std::chrono::milliseconds(jp::config::kDefaultLaunchIntervalMs));
    CHECK(config.accepts_scheme("jelly-player"));
    CHECK(config.accepts_scheme("mpv"));
    CHECK(config.default_profile("mpv-cinema") == std::string("cinema"));
    CHECK_FALSE(config.default_profile("jelly-player").has_value());
    CHECK_FALSE(config.executable_for("mpv").has_value());

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}

TEST_CASE("HandlerConfigStore persists handler settings")
{
    auto temp_root = jp::tests::make_temp_root("config-persist");
    auto db_path = temp_root / "settings.db";
    {
        jp::config::HandlerConfigStore store(db_path);
        REQUIRE(store.is_valid());

        auto config = jp::config::default_handler_config(temp_root);
        config.player_paths["mpv"] = "/usr/bin/mpv";
        config.scheme_profiles.clear();
        config.scheme_profiles["jelly-player"] = "jelly";
        config.user_agents.push_back({"/emby/", "Emby/4.8"});
        config.log_enabled = true;
        config.log_path = temp_root / "custom.log";
        config.launch_interval = std::chrono::milliseconds(75);
        REQUIRE(store.persist(config));
    }

    jp::storage::Database reader(db_path);
    REQUIRE(reader.is_valid());
    CHECK(reader.get_setting("player.mpv.path") == std::string("/usr/bin/mpv"));
    CHECK(reader.get_setting("scheme.jelly-player.profile") ==
          std::string("jelly"));
    CHECK(reader.get_setting("userAgent./emby/") == std::string("Emby/4.8"));
    CHECK(reader.get_setting("logEnabled") == std::string("1"));

    jp::config::HandlerConfigStore store(db_path);
    auto loaded = store.load(jp::config::default_handler_config(temp_root));
    CHECK(loaded.executable_for("mpv") == std::filesystem::path("/usr/bin/mpv"));
    CHECK(loaded.accepts_scheme("jelly-player"));
    // Stored schemes replace the built-in defaults.
    CHECK_FALSE(loaded.accepts_scheme("mpv-cinema"));
    CHECK(loaded.default_profile("jelly-player") == std::string("jelly"));
    REQUIRE(loaded.user_agents.size() == 1);
    CHECK(loaded.user_agents[0].pattern == "/emby/");
    CHECK(loaded.user_agents[0].user_agent == "Emby/4.8");
    CHECK(loaded.log_enabled);
    CHECK(loaded.log_path == temp_root / "custom.log");
    CHECK(loaded.launch_interval == std::chrono::milliseconds(75));

    CHECK(store.remove_scheme("jelly-player"));
    CHECK_FALSE(reader.get_setting("scheme.jelly-player.profile").has_value());

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}

TEST_CASE("malformed stored values fall back to defaults")
{
    auto temp_root = jp::tests::make_temp_root("config-malformed");
    auto db_path = temp_root / "settings.db";
    {
        jp::storage::Database writer(db_path);
        REQUIRE(writer.is_valid());
        CHECK(writer.set_setting("launchIntervalMs", "soon"));
        CHECK(writer.set_setting("logEnabled", "maybe"));
        CHECK(writer.set_setting("player.vlc.path", ""));
        CHECK(writer.set_setting("player..path", "/bin/true"));
    }
    jp::config::HandlerConfigStore store(db_path);
    auto config = store.load(jp::config::default_handler_config(temp_root));
    CHECK(config.launch_interval ==
          std::chrono::milliseconds(jp::config::kDefaultLaunchIntervalMs));
    CHECK_FALSE(config.log_enabled);
    CHECK_FALSE(config.executable_for("vlc").has_value());
    CHECK_FALSE(config.executable_for("").has_value());

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}

TEST_CASE("store without a path is invalid and yields defaults")
{
    jp::config::HandlerConfigStore store{std::filesystem::path{}};
    CHECK_FALSE(store.is_valid());
    auto config = store.load(jp::config::default_handler_config("/tmp"));
    CHECK(config.accepts_scheme("jelly-player"));
    CHECK_FALSE(store.persist(config));
}

TEST_CASE("settings are listed by key prefix")
{
    auto temp_root = jp::tests::make_temp_root("config-prefix");
    jp::storage::Database db(temp_root / "settings.db");
    REQUIRE(db.is_valid());
    CHECK(db.set_setting("player.vlc.path", "/b"));
    CHECK(db.set_setting("player.mpv.path", "/a"));
    CHECK(db.set_setting("playerX", "ignored"));
    auto players = db.list_settings("player.");
    REQUIRE(players.size() == 2);
    CHECK(players[0].first == "player.mpv.path");
    CHECK(players[1].first == "player.vlc.path");
    CHECK(players[1].second == "/b");

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}

#if !defined(_WIN32)
TEST_CASE("environment overrides logging settings")
{
    auto config = jp::config::default_handler_config("/tmp");
    ::setenv("JP_LOG_ENABLED", "true", 1);
    ::setenv("JP_LOG_PATH", "/tmp/jp-tests/env.log", 1);
    auto overridden = jp::config::apply_environment_overrides(config);
    ::unsetenv("JP_LOG_ENABLED");
    ::unsetenv("JP_LOG_PATH");
    CHECK(overridden.log_enabled);
    CHECK(overridden.log_path == std::filesystem::path("/tmp/jp-tests/env.log"));

    auto untouched = jp::config::apply_environment_overrides(config);
    CHECK_FALSE(untouched.log_enabled);
}
#endif

TEST_CASE("user agent lookup ignores query strings")
{
    jp::config::HandlerConfig config;
    config.user_agents.push_back({"/stream", "UA"});
    CHECK(config.user_agent_for("http://h/a/stream.mkv") == std::string("UA"));
    CHECK_FALSE(config.user_agent_for("http://h/a?x=/stream").has_value());
    CHECK_FALSE(config.user_agent_for("http://h").has_value());
    CHECK(config.user_agent_for("/local/stream") == std::string("UA"));
}

TEST_CASE("stored scheme keys are matched case-insensitively")
{
    auto temp_root = jp::tests::make_temp_root("config-scheme-case");
    auto db_path = temp_root / "settings.db";
    {
        jp::storage::Database writer(db_path);
        REQUIRE(writer.is_valid());
        REQUIRE(writer.set_setting("scheme.Jelly-Player.profile", "multi"));
    }

    jp::config::HandlerConfigStore store(db_path);
    auto config = store.load(jp::config::default_handler_config(temp_root));
    CHECK(config.accepts_scheme("jelly-player"));
    CHECK(config.default_profile("jelly-player") == std::string("multi"));
    CHECK_FALSE(config.accepts_scheme("Jelly-Player"));

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}
