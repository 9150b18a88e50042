#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/types.h>
#endif

#include "launch/ProcessLauncher.hpp"

#include <format>
#include <string_view>
#include <system_error>

#if !defined(_WIN32)
extern char **environ;
#endif

namespace jp::launch
{

#if defined(_WIN32)
namespace
{
std::wstring utf8_to_wide(std::string_view text)
{
    if (text.empty())
    {
        return {};
    }
    int required = MultiByteToWideChar(
        CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (required <= 0)
    {
        return {};
    }
    std::wstring wide;
    wide.resize(static_cast<size_t>(required));
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                        wide.data(), required);
    return wide;
}
} // namespace

std::string quote_windows_argument(std::string const &argument)
{
    if (!argument.empty() &&
        argument.find_first_of(" \t\n\v\"") == std::string::npos)
    {
        return argument;
    }
    std::string quoted = "\"";
    for (auto it = argument.begin();; ++it)
    {
        std::size_t backslashes = 0;
        while (it != argument.end() && *it == '\\')
        {
            ++it;
            ++backslashes;
        }
        if (it == argument.end())
        {
            quoted.append(backslashes * 2, '\\');
            break;
        }
        if (*it == '"')
        {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back(*it);
        }
        else
        {
            quoted.append(backslashes, '\\');
            quoted.push_back(*it);
        }
    }
    quoted.push_back('"');
    return quoted;
}

LaunchResult SystemProcessLauncher::launch(std::vector<std::string> const &argv)
{
    LaunchResult result;
    if (argv.empty() || argv.front().empty())
    {
        result.message = "empty command line";
        return result;
    }
    std::string command_line;
    for (auto const &argument : argv)
    {
        if (!command_line.empty())
        {
            command_line.push_back(' ');
        }
        command_line += quote_windows_argument(argument);
    }
    auto application = utf8_to_wide(argv.front());
    auto wide_command = utf8_to_wide(command_line);

    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    PROCESS_INFORMATION process{};
    if (!CreateProcessW(application.c_str(), wide_command.data(), nullptr,
                        nullptr, FALSE, DETACHED_PROCESS, nullptr, nullptr,
                        &startup, &process))
    {
        std::error_code ec(static_cast<int>(GetLastError()),
                           std::system_category());
        result.message = std::format("CreateProcess failed: {}", ec.message());
        return result;
    }
    CloseHandle(process.hThread);
    CloseHandle(process.hProcess);
    result.success = true;
    result.message = std::format("pid {}", process.dwProcessId);
    return result;
}
#else
LaunchResult SystemProcessLauncher::launch(std::vector<std::string> const &argv)
{
    LaunchResult result;
    if (argv.empty() || argv.front().empty())
    {
        result.message = "empty command line";
        return result;
    }
    std::vector<char *> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (auto const &argument : argv)
    {
        raw_argv.push_back(const_cast<char *>(argument.c_str()));
    }
    raw_argv.push_back(nullptr);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
#if defined(POSIX_SPAWN_SETSID)
    // Player runs in its own session.
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSID);
#endif
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, raw_argv.front(), nullptr, &attributes,
                          raw_argv.data(), environ);
    posix_spawnattr_destroy(&attributes);
    if (rc != 0)
    {
        result.message = std::format("posix_spawn failed: {}", std::strerror(rc));
        return result;
    }
    result.success = true;
    result.message = std::format("pid {}", static_cast<long long>(pid));
    return result;
}
#endif

} // namespace jp::launch
