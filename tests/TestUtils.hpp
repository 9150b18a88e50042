#pragma once

#include "launch/ProcessLauncher.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jp::tests
{

// Records every launch instead of spawning. Executables listed in
// `failing` report a start failure.
class RecordingLauncher final : public launch::IProcessLauncher
{
  public:
    launch::LaunchResult launch(std::vector<std::string> const &argv) override
    {
        calls.push_back(argv);
        times.push_back(std::chrono::steady_clock::now());
        launch::LaunchResult result;
        if (!argv.empty() && failing.count(argv.front()) != 0)
        {
            result.message = "spawn refused";
            return result;
        }
        result.success = true;
        result.message = "pid 42";
        return result;
    }

    std::vector<std::vector<std::string>> calls;
    std::vector<std::chrono::steady_clock::time_point> times;
    std::set<std::string> failing;
};

inline std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root = std::filesystem::temp_directory_path() / "jp-tests" / tag;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

inline bool contains(std::vector<std::string> const &values,
                     std::string_view expected)
{
    for (auto const &value : values)
    {
        if (value == expected)
        {
            return true;
        }
    }
    return false;
}

} // namespace jp::tests
