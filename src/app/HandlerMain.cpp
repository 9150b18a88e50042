#include "app/HandlerMain.hpp"

#include "app/UriHandler.hpp"
#include "config/HandlerConfig.hpp"
#include "install/ProtocolRegistration.hpp"
#include "launch/BuilderRegistry.hpp"
#include "launch/ProcessLauncher.hpp"
#include "payload/SchemeUri.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jp::app
{

namespace
{
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPayloadRejected = 2;

void print_usage()
{
    jp::log::print_status("{}: a custom-scheme handler for media players.",
                          version::kDisplayVersion);
    jp::log::print_status("Usage:");
    jp::log::print_status("  jelly-player-handler <scheme>://<payload>");
    jp::log::print_status("  jelly-player-handler --install --scheme <scheme> "
                          "[--target <target>] \"<path-to-player>\"");
    jp::log::print_status("  jelly-player-handler --uninstall --scheme <scheme>");
    jp::log::print_status("\nExample:");
    jp::log::print_status("  jelly-player-handler --install --scheme "
                          "jelly-player /usr/bin/mpv");
    jp::log::print_status("\nSettings are stored in {}",
                          (utils::config_root() / config::kDatabaseFileName)
                              .string());
}

void print_error(std::string_view message)
{
    std::fprintf(stderr, "Error: %.*s\n", static_cast<int>(message.size()),
                 message.data());
}

CommandLine invalid(std::string message)
{
    CommandLine command;
    command.mode = CommandMode::Invalid;
    command.error = std::move(message);
    return command;
}

std::filesystem::path settings_path(std::filesystem::path const &root)
{
    if (char const *env = std::getenv("JP_CONFIG_PATH"); env && env[0] != '\0')
    {
        return std::filesystem::path(env);
    }
    return root / config::kDatabaseFileName;
}

int run_install(CommandLine const &command, config::HandlerConfigStore &store,
                config::HandlerConfig config)
{
    if (launch::BuilderRegistry::instance().find(command.target) == nullptr)
    {
        print_error("unsupported target " + command.target);
        return kExitFailure;
    }
    std::error_code ec;
    if (!std::filesystem::exists(command.player_path, ec))
    {
        print_error("player not found at the specified path: " +
                    command.player_path.string());
        return kExitFailure;
    }
    auto player = std::filesystem::absolute(command.player_path, ec);
    if (ec)
    {
        player = command.player_path;
    }
    auto exe = utils::executable_path();
    if (!exe)
    {
        print_error("unable to determine executable path");
        return kExitFailure;
    }

    config.player_paths[command.target] = player;
    config.scheme_profiles.try_emplace(command.scheme, std::string{});
    if (!store.persist(config))
    {
        print_error("failed to save settings");
        return kExitFailure;
    }
    auto registration = install::register_scheme_handler(command.scheme, *exe);
    if (!registration.success)
    {
        print_error("install failed: " +
                    install::describe_failure(registration));
        return kExitFailure;
    }
    jp::log::print_status("{}", registration.message);
    return kExitOk;
}

int run_uninstall(CommandLine const &command,
                  config::HandlerConfigStore &store)
{
    auto registration = install::unregister_scheme_handler(command.scheme);
    if (!registration.success)
    {
        print_error("uninstall failed: " +
                    install::describe_failure(registration));
        return kExitFailure;
    }
    if (store.is_valid() && !store.remove_scheme(command.scheme))
    {
        JP_LOG_WARN("unable to remove scheme {} from settings", command.scheme);
    }
    jp::log::print_status("{}", registration.message);
    return kExitOk;
}

} // namespace

CommandLine parse_command_line(int argc, char const *const argv[])
{
    CommandLine command;
    if (argc < 2 || argv[1] == nullptr)
    {
        return command;
    }
    std::string_view first = argv[1];
    if (first == "--help" || first == "-h")
    {
        return command;
    }
    if (first == "--version")
    {
        command.mode = CommandMode::Version;
        return command;
    }
    if (first != "--install" && first != "--uninstall")
    {
        command.mode = CommandMode::Handle;
        command.uri = std::string(first);
        return command;
    }

    bool const install = first == "--install";
    command.mode = install ? CommandMode::Install : CommandMode::Uninstall;
    command.target = config::kDefaultTarget;
    std::optional<std::string> positional;
    for (int index = 2; index < argc; ++index)
    {
        if (argv[index] == nullptr)
        {
            continue;
        }
        std::string_view arg = argv[index];
        bool const has_value = index + 1 < argc && argv[index + 1] != nullptr;
        if (arg == "--scheme" || arg == "--target")
        {
            if (!has_value)
            {
                return invalid(std::string(arg) + " requires a value");
            }
            (arg == "--scheme" ? command.scheme : command.target) =
                argv[++index];
            continue;
        }
        if (arg.starts_with("--"))
        {
            return invalid("unknown option " + std::string(arg));
        }
        if (positional)
        {
            return invalid("unexpected argument " + std::string(arg));
        }
        positional = std::string(arg);
    }

    if (command.scheme.empty())
    {
        return invalid("--scheme is required");
    }
    if (!payload::is_valid_scheme_name(command.scheme))
    {
        return invalid("invalid scheme name " + command.scheme);
    }
    command.scheme = payload::normalize_scheme_name(command.scheme);
    if (install)
    {
        if (!positional || positional->empty())
        {
            return invalid("--install requires the path to the player");
        }
        command.player_path = std::filesystem::u8path(*positional);
    }
    else if (positional)
    {
        return invalid("unexpected argument " + *positional);
    }
    return command;
}

config::HandlerConfig load_handler_config(std::filesystem::path const &root,
                                          config::HandlerConfigStore const &store)
{
    auto defaults = config::default_handler_config(root);
    // Until the store is read only the environment can enable the log.
    auto early = config::apply_environment_overrides(defaults);
    jp::log::configure_file_sink(early.log_enabled, early.log_path);
    if (!store.is_valid())
    {
        JP_LOG_WARN("settings database unavailable; using defaults");
    }
    auto config =
        config::apply_environment_overrides(store.load(std::move(defaults)));
    jp::log::configure_file_sink(config.log_enabled, config.log_path);
    return config;
}

int handler_main(int argc, char *argv[])
{
    try
    {
        auto command = parse_command_line(argc, argv);
        switch (command.mode)
        {
        case CommandMode::Usage:
            print_usage();
            return kExitOk;
        case CommandMode::Version:
            jp::log::print_status("{}", version::kDisplayVersion);
            return kExitOk;
        case CommandMode::Invalid:
            print_error(command.error);
            print_usage();
            return kExitFailure;
        default:
            break;
        }

        auto root = utils::config_root();
        config::HandlerConfigStore store(settings_path(root));
        auto config = load_handler_config(root, store);

        if (command.mode == CommandMode::Install)
        {
            return run_install(command, store, std::move(config));
        }
        if (command.mode == CommandMode::Uninstall)
        {
            return run_uninstall(command, store);
        }

        auto result = handle_uri(command.uri, config,
                                 std::make_shared<launch::SystemProcessLauncher>());
        return result.ok() ? kExitOk : kExitPayloadRejected;
    }
    catch (std::exception const &ex)
    {
        JP_LOG_ERROR("jelly-player-handler failed: {}", ex.what());
        return kExitFailure;
    }
}

} // namespace jp::app
