#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <winreg.h>
#endif

#include "install/ProtocolRegistration.hpp"

#include "payload/SchemeUri.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace jp::install
{

namespace
{
[[maybe_unused]] std::string escape_shell_argument(std::string const &value)
{
    std::string result;
    result.reserve(value.size() + 2);
    result.push_back('\'');
    for (char ch : value)
    {
        if (ch == '\'')
        {
            result += "'\\''";
            continue;
        }
        result.push_back(ch);
    }
    result.push_back('\'');
    return result;
}

[[maybe_unused]] bool run_external_command(std::string const &command)
{
    if (command.empty())
    {
        return false;
    }
    int status = std::system(command.c_str());
    return status == 0;
}

[[maybe_unused]] std::string upper_case(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::toupper(ch)); });
    return value;
}
} // namespace

std::string desktop_entry_name(std::string const &scheme)
{
    return std::format("jelly-player-handler-{}.desktop", scheme);
}

std::string desktop_entry_contents(std::string const &scheme,
                                   std::filesystem::path const &handler_exe)
{
    std::ostringstream output;
    output << "[Desktop Entry]\n";
    output << "Type=Application\n";
    output << std::format("Name=Jelly Player Handler ({})\n", scheme);
    output << std::format("Exec={} %u\n",
                          quote_exec_argument(handler_exe.string()));
    output << std::format("MimeType=x-scheme-handler/{};\n", scheme);
    output << "Categories=AudioVideo;Player;\n";
    output << "Terminal=false\n";
    output << "NoDisplay=true\n";
    output << "StartupNotify=false\n";
    return output.str();
}

std::string quote_exec_argument(std::string const &value)
{
    // Quoting rules first, then the string-value escape of each backslash.
    std::string quoted = "\"";
    for (char ch : value)
    {
        switch (ch)
        {
        case '"':
        case '`':
        case '$':
            quoted += "\\\\";
            quoted.push_back(ch);
            break;
        case '\\':
            quoted += "\\\\\\\\";
            break;
        case '%':
            quoted += "%%";
            break;
        default:
            quoted.push_back(ch);
            break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

std::string describe_failure(RegistrationResult const &result)
{
    if (!result.permission_denied)
    {
        return result.message;
    }
#if defined(_WIN32)
    return result.message +
           " (access to the registry was denied; check the account's rights "
           "on HKEY_CURRENT_USER\\Software\\Classes)";
#else
    return result.message +
           " (permission denied; check ownership of the applications "
           "directory)";
#endif
}

std::optional<std::filesystem::path> xdg_applications_dir()
{
    std::filesystem::path data_home;
    if (char const *xdg = std::getenv("XDG_DATA_HOME"); xdg && xdg[0] != '\0')
    {
        data_home = xdg;
    }
    else if (char const *home = std::getenv("HOME"); home && home[0] != '\0')
    {
        data_home = std::filesystem::path(home) / ".local/share";
    }
    else
    {
        return std::nullopt;
    }
    return data_home / "applications";
}

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

RegistrationResult fail(std::string const &context, LSTATUS code)
{
    RegistrationResult failure;
    failure.permission_denied = code == ERROR_ACCESS_DENIED;
    if (failure.permission_denied)
    {
        failure.message = "permission-denied";
    }
    else
    {
        std::error_code ec(static_cast<int>(code), std::system_category());
        failure.message = context + ": " + ec.message();
    }
    return failure;
}

LSTATUS set_value(std::wstring const &subkey, std::wstring const &value_name,
                  std::wstring const &value)
{
    HKEY handle = nullptr;
    DWORD disposition = 0;
    auto status = RegCreateKeyExW(HKEY_CURRENT_USER, subkey.c_str(), 0, nullptr,
                                  REG_OPTION_NON_VOLATILE, KEY_WRITE, nullptr,
                                  &handle, &disposition);
    if (status != ERROR_SUCCESS)
    {
        return status;
    }
    auto name_ptr = value_name.empty() ? nullptr : value_name.c_str();
    auto data_ptr = reinterpret_cast<const BYTE *>(value.c_str());
    auto data_size = static_cast<DWORD>((value.size() + 1) * sizeof(wchar_t));
    status = RegSetValueExW(handle, name_ptr, 0, REG_SZ, data_ptr, data_size);
    RegCloseKey(handle);
    return status;
}
} // namespace

RegistrationResult register_scheme_handler(std::string const &scheme,
                                           std::filesystem::path const &handler_exe)
{
    if (!payload::is_valid_scheme_name(scheme))
    {
        return {false, false, std::format("invalid scheme name {}", scheme)};
    }
    auto root = L"Software\\Classes\\" + utf8_to_wide(scheme);
    auto exe = handler_exe.wstring();
    auto command = L"\"" + exe + L"\" \"%1\"";

    if (auto status = set_value(
            root, {}, utf8_to_wide("URL:" + upper_case(scheme) + " Protocol"));
        status != ERROR_SUCCESS)
    {
        return fail("scheme registration failed", status);
    }
    if (auto status = set_value(root, L"URL Protocol", L"");
        status != ERROR_SUCCESS)
    {
        return fail("scheme registration failed", status);
    }
    if (auto status = set_value(root + L"\\DefaultIcon", {}, exe + L",0");
        status != ERROR_SUCCESS)
    {
        return fail("icon registration failed", status);
    }
    if (auto status = set_value(root + L"\\shell\\open\\command", {}, command);
        status != ERROR_SUCCESS)
    {
        return fail("command registration failed", status);
    }
    JP_LOG_INFO("registered {} handler ({})", scheme, handler_exe.string());
    return {true, false, std::format("protocol installed: {}", scheme)};
}

RegistrationResult unregister_scheme_handler(std::string const &scheme)
{
    if (!payload::is_valid_scheme_name(scheme))
    {
        return {false, false, std::format("invalid scheme name {}", scheme)};
    }
    auto root = L"Software\\Classes\\" + utf8_to_wide(scheme);
    auto status = RegDeleteTreeW(HKEY_CURRENT_USER, root.c_str());
    if (status != ERROR_SUCCESS && status != ERROR_FILE_NOT_FOUND)
    {
        return fail("scheme removal failed", status);
    }
    JP_LOG_INFO("unregistered {} handler", scheme);
    return {true, false, std::format("protocol uninstalled: {}", scheme)};
}

#elif defined(__linux__)

RegistrationResult register_scheme_handler(std::string const &scheme,
                                           std::filesystem::path const &handler_exe)
{
    RegistrationResult result;
    if (!payload::is_valid_scheme_name(scheme))
    {
        result.message = std::format("invalid scheme name {}", scheme);
        return result;
    }
    auto applications = xdg_applications_dir();
    if (!applications)
    {
        result.message = "HOME environment variable is not set";
        return result;
    }
    std::error_code ec;
    std::filesystem::create_directories(*applications, ec);
    if (ec)
    {
        result.permission_denied = (ec == std::errc::permission_denied);
        result.message = std::format("unable to ensure {}: {}",
                                     applications->string(), ec.message());
        return result;
    }
    auto desktop_file = *applications / desktop_entry_name(scheme);
    auto tmp_file = desktop_file;
    tmp_file += ".tmp";
    std::ofstream output(tmp_file, std::ios::trunc);
    if (!output)
    {
        result.message = std::format("unable to write {}", tmp_file.string());
        return result;
    }
    output << desktop_entry_contents(scheme, handler_exe);
    output.close();
    if (!output)
    {
        result.message = std::format("failed to write {}", tmp_file.string());
        return result;
    }
    std::filesystem::rename(tmp_file, desktop_file, ec);
    if (ec)
    {
        result.permission_denied = (ec == std::errc::permission_denied);
        result.message = std::format("unable to store {}: {}",
                                     desktop_file.string(), ec.message());
        return result;
    }
    auto command = std::format(
        "xdg-mime default {} {}", escape_shell_argument(desktop_entry_name(scheme)),
        escape_shell_argument("x-scheme-handler/" + scheme));
    result.success = true;
    if (run_external_command(command))
    {
        result.message = std::format("protocol installed: {}", scheme);
    }
    else
    {
        result.message = "desktop entry created; xdg-mime failed (ensure "
                         "xdg-utils installed)";
    }
    JP_LOG_INFO("registered {} handler ({})", scheme, handler_exe.string());
    return result;
}

RegistrationResult unregister_scheme_handler(std::string const &scheme)
{
    RegistrationResult result;
    if (!payload::is_valid_scheme_name(scheme))
    {
        result.message = std::format("invalid scheme name {}", scheme);
        return result;
    }
    auto applications = xdg_applications_dir();
    if (!applications)
    {
        result.message = "HOME environment variable is not set";
        return result;
    }
    auto desktop_file = *applications / desktop_entry_name(scheme);
    std::error_code ec;
    std::filesystem::remove(desktop_file, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        result.permission_denied = (ec == std::errc::permission_denied);
        result.message = std::format("unable to remove {}: {}",
                                     desktop_file.string(), ec.message());
        return result;
    }
    JP_LOG_INFO("unregistered {} handler", scheme);
    result.success = true;
    result.message = std::format("protocol uninstalled: {}", scheme);
    return result;
}

#else

RegistrationResult register_scheme_handler(std::string const &scheme,
                                           std::filesystem::path const &)
{
    return {false, false,
            std::format("registering {} is unsupported on this platform",
                        scheme)};
}

RegistrationResult unregister_scheme_handler(std::string const &scheme)
{
    return {false, false,
            std::format("unregistering {} is unsupported on this platform",
                        scheme)};
}

#endif

} // namespace jp::install
