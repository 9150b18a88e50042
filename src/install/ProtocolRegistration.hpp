#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace jp::install
{

struct RegistrationResult
{
    bool success = false;
    bool permission_denied = false;
    std::string message;
};

// Points "<scheme>://" links at `handler_exe` for the current user.
RegistrationResult register_scheme_handler(std::string const &scheme,
                                           std::filesystem::path const &handler_exe);
RegistrationResult unregister_scheme_handler(std::string const &scheme);

// User-facing text for a failed result, with a hint when the OS refused
// access.
std::string describe_failure(RegistrationResult const &result);

std::string desktop_entry_name(std::string const &scheme);
std::string desktop_entry_contents(std::string const &scheme,
                                   std::filesystem::path const &handler_exe);
// Quotes `value` as one argument of a desktop entry Exec key.
std::string quote_exec_argument(std::string const &value);
std::optional<std::filesystem::path> xdg_applications_dir();

} // namespace jp::install
