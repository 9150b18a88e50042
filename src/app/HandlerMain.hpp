#pragma once

#include "config/HandlerConfig.hpp"

#include <filesystem>
#include <string>

namespace jp::app
{

enum class CommandMode
{
    Usage,
    Version,
    Handle,
    Install,
    Uninstall,
    Invalid,
};

struct CommandLine
{
    CommandMode mode = CommandMode::Usage;
    std::string uri;
    std::string scheme;
    std::string target;
    std::filesystem::path player_path;
    std::string error;
};

//   <uri>
//   --install --scheme <scheme> [--target <target>] <player-path>
//   --uninstall --scheme <scheme>
//   --version
CommandLine parse_command_line(int argc, char const *const argv[]);

// Reads settings over `root`'s defaults, applies the environment and points
// the log file sink at the result. The sink is already live while the store
// is read.
config::HandlerConfig load_handler_config(std::filesystem::path const &root,
                                          config::HandlerConfigStore const &store);

// Entry point shared by main(); returns the process exit code.
int handler_main(int argc, char *argv[]);

} // namespace jp::app
