#pragma once

#include "utils/StateStore.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jp::config
{

inline constexpr int kDefaultLaunchIntervalMs = 50;
inline constexpr char const kDefaultScheme[] = "jelly-player";
inline constexpr char const kDefaultTarget[] = "mpv";
inline constexpr char const kLogFileName[] = "jelly-player-handler.log";
inline constexpr char const kDatabaseFileName[] = "jelly-player-handler.db";

struct UserAgentRule
{
    // Matched as a substring of the media URL's path.
    std::string pattern;
    std::string user_agent;
};

// Read-only for the lifetime of one invocation.
struct HandlerConfig
{
    std::map<std::string, std::filesystem::path, std::less<>> player_paths;
    // Registered schemes mapped to their default profile (may be empty).
    std::map<std::string, std::string, std::less<>> scheme_profiles;
    std::vector<UserAgentRule> user_agents;
    bool log_enabled = false;
    std::filesystem::path log_path;
    std::chrono::milliseconds launch_interval{kDefaultLaunchIntervalMs};

    // nullopt when the target is unknown or its path is empty.
    std::optional<std::filesystem::path>
    executable_for(std::string_view target) const;
    bool accepts_scheme(std::string_view scheme) const;
    std::optional<std::string> default_profile(std::string_view scheme) const;
    std::optional<std::string> user_agent_for(std::string_view url) const;
};

HandlerConfig default_handler_config(std::filesystem::path const &root);

// JP_LOG_ENABLED / JP_LOG_PATH take precedence over stored values.
HandlerConfig apply_environment_overrides(HandlerConfig config);

// Settings are stored as flat keys in the sqlite settings table:
//   player.<target>.path, scheme.<scheme>.profile, userAgent.<pattern>,
//   logEnabled, logPath, launchIntervalMs
class HandlerConfigStore
{
  public:
    explicit HandlerConfigStore(std::filesystem::path state_path);

    // Stored values override `defaults`. Default schemes are only used
    // while no scheme has been stored.
    HandlerConfig load(HandlerConfig defaults) const;
    bool persist(HandlerConfig const &config) const;

    bool remove_scheme(std::string const &scheme) const;
    bool is_valid() const noexcept;

  private:
    std::shared_ptr<storage::Database> db_;
};

} // namespace jp::config
