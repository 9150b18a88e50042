#include "app/HandlerMain.hpp"
#include "TestUtils.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

#if !defined(JP_BUILD_MINIMAL)

namespace
{

std::vector<std::string> read_lines(std::filesystem::path const &path)
{
    std::vector<std::string> lines;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line))
    {
        lines.push_back(line);
    }
    return lines;
}

// "[I 2024-01-31 12:34:56.789] "
bool has_log_prefix(std::string const &line, char level)
{
    std::string const shape = "[L DDDD-DD-DD DD:DD:DD.DDD] ";
    if (line.size() < shape.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < shape.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(line[i]);
        switch (shape[i])
        {
        case 'L':
            if (line[i] != level)
            {
                return false;
            }
            break;
        case 'D':
            if (!std::isdigit(ch))
            {
                return false;
            }
            break;
        default:
            if (line[i] != shape[i])
            {
                return false;
            }
            break;
        }
    }
    return true;
}

} // namespace

TEST_CASE("file sink appends timestamped lines only while enabled")
{
    auto temp_root = jp::tests::make_temp_root("log-sink");
    auto log_path = temp_root / "logs" / "handler.log";

    jp::log::configure_file_sink(true, log_path);
    CHECK(jp::log::file_sink_enabled());
    JP_LOG_INFO("launching {} instruction(s)", 2);

    auto lines = read_lines(log_path);
    REQUIRE(lines.size() == 1);
    CHECK(has_log_prefix(lines[0], 'I'));
    CHECK(lines[0].ends_with("] launching 2 instruction(s)"));

    jp::log::configure_file_sink(false, log_path);
    CHECK_FALSE(jp::log::file_sink_enabled());
    JP_LOG_WARN("not written");
    CHECK(read_lines(log_path).size() == 1);

    jp::log::configure_file_sink(true, {});
    CHECK_FALSE(jp::log::file_sink_enabled());

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}

#if !defined(_WIN32)
TEST_CASE("settings failures reach the log file enabled from the environment")
{
    auto temp_root = jp::tests::make_temp_root("log-early");
    auto log_path = temp_root / "early.log";
    ::setenv("JP_LOG_ENABLED", "1", 1);
    ::setenv("JP_LOG_PATH", log_path.c_str(), 1);

    jp::config::HandlerConfigStore store{std::filesystem::path{}};
    auto config = jp::app::load_handler_config(temp_root, store);
    ::unsetenv("JP_LOG_ENABLED");
    ::unsetenv("JP_LOG_PATH");
    jp::log::configure_file_sink(false, {});

    CHECK(config.log_enabled);
    CHECK(config.log_path == log_path);
    auto lines = read_lines(log_path);
    REQUIRE(lines.size() == 1);
    CHECK(has_log_prefix(lines[0], 'W'));
    CHECK(lines[0].find("settings database unavailable") != std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
}
#endif

#endif
