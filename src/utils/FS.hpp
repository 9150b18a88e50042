#pragma once

#include <filesystem>
#include <optional>

namespace jp::utils
{

// Directory holding the settings database and the default log file.
std::filesystem::path config_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> user_config_root();

} // namespace jp::utils
