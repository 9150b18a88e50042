#include "config/HandlerConfig.hpp"

#include "payload/SchemeUri.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <system_error>
#include <utility>

namespace jp::config
{

namespace
{
constexpr std::string_view kPlayerPrefix = "player.";
constexpr std::string_view kPlayerSuffix = ".path";
constexpr std::string_view kSchemePrefix = "scheme.";
constexpr std::string_view kSchemeSuffix = ".profile";
constexpr std::string_view kUserAgentPrefix = "userAgent.";

bool parse_bool(std::optional<std::string> const &value, bool fallback)
{
    if (!value)
    {
        return fallback;
    }
    if (value->empty())
    {
        return fallback;
    }
    if (*value == "1")
    {
        return true;
    }
    if (*value == "0")
    {
        return false;
    }
    std::string lowercase = *value;
    std::transform(lowercase.begin(), lowercase.end(), lowercase.begin(),
                   [](unsigned char ch)
                   {
                       return static_cast<char>(std::tolower(ch));
                   });
    if (lowercase == "true" || lowercase == "yes")
    {
        return true;
    }
    if (lowercase == "false" || lowercase == "no")
    {
        return false;
    }
    return fallback;
}

std::string bool_to_string(bool value)
{
    return value ? "1" : "0";
}

std::optional<int> parse_int(std::optional<std::string> const &value)
{
    if (!value || value->empty())
    {
        return std::nullopt;
    }
    int parsed = 0;
    auto const *begin = value->data();
    auto const *end = begin + value->size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return parsed;
}

// "player.mpv.path" -> "mpv"
std::optional<std::string> key_infix(std::string_view key,
                                     std::string_view prefix,
                                     std::string_view suffix)
{
    if (key.size() <= prefix.size() + suffix.size() ||
        !key.starts_with(prefix) || !key.ends_with(suffix))
    {
        return std::nullopt;
    }
    return std::string(key.substr(
        prefix.size(), key.size() - prefix.size() - suffix.size()));
}

std::string make_key(std::string_view prefix, std::string_view name,
                     std::string_view suffix)
{
    return std::format("{}{}{}", prefix, name, suffix);
}

std::string_view url_path(std::string_view url)
{
    auto start = std::size_t{0};
    if (auto scheme = url.find("://"); scheme != std::string_view::npos)
    {
        start = url.find('/', scheme + 3);
        if (start == std::string_view::npos)
        {
            return {};
        }
    }
    auto end = url.find_first_of("?#", start);
    if (end == std::string_view::npos)
    {
        end = url.size();
    }
    return url.substr(start, end - start);
}

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

std::optional<std::filesystem::path>
HandlerConfig::executable_for(std::string_view target) const
{
    auto it = player_paths.find(target);
    if (it == player_paths.end() || it->second.empty())
    {
        return std::nullopt;
    }
    return it->second;
}

bool HandlerConfig::accepts_scheme(std::string_view scheme) const
{
    return scheme_profiles.find(scheme) != scheme_profiles.end();
}

std::optional<std::string>
HandlerConfig::default_profile(std::string_view scheme) const
{
    auto it = scheme_profiles.find(scheme);
    if (it == scheme_profiles.end() || it->second.empty())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string>
HandlerConfig::user_agent_for(std::string_view url) const
{
    auto path = url_path(url);
    if (path.empty())
    {
        return std::nullopt;
    }
    for (auto const &rule : user_agents)
    {
        if (!rule.pattern.empty() &&
            path.find(rule.pattern) != std::string_view::npos)
        {
            return rule.user_agent;
        }
    }
    return std::nullopt;
}

HandlerConfig default_handler_config(std::filesystem::path const &root)
{
    HandlerConfig config;
    config.scheme_profiles.emplace(kDefaultScheme, "");
    config.scheme_profiles.emplace("mpv", "multi");
    config.scheme_profiles.emplace("mpv-cinema", "cinema");
    config.log_path = root / kLogFileName;
    return config;
}

HandlerConfig apply_environment_overrides(HandlerConfig config)
{
    if (auto env = read_env("JP_LOG_ENABLED"); env)
    {
        config.log_enabled = parse_bool(env, config.log_enabled);
    }
    if (auto env = read_env("JP_LOG_PATH"); env && !env->empty())
    {
        config.log_path = std::filesystem::path(*env);
    }
    return config;
}

HandlerConfigStore::HandlerConfigStore(std::filesystem::path state_path)
{
    if (state_path.empty())
    {
        return;
    }
    db_ = std::make_shared<storage::Database>(std::move(state_path));
}

bool HandlerConfigStore::is_valid() const noexcept
{
    return db_ && db_->is_valid();
}

HandlerConfig HandlerConfigStore::load(HandlerConfig defaults) const
{
    HandlerConfig result = std::move(defaults);
    if (!is_valid())
    {
        return result;
    }
    result.log_enabled =
        parse_bool(db_->get_setting("logEnabled"), result.log_enabled);
    if (auto path = db_->get_setting("logPath"); path && !path->empty())
    {
        result.log_path = std::filesystem::u8path(*path);
    }
    if (auto interval = parse_int(db_->get_setting("launchIntervalMs"));
        interval && *interval >= 0)
    {
        result.launch_interval = std::chrono::milliseconds(*interval);
    }

    for (auto const &[key, value] : db_->list_settings(std::string(kPlayerPrefix)))
    {
        if (auto target = key_infix(key, kPlayerPrefix, kPlayerSuffix))
        {
            result.player_paths[*target] = std::filesystem::u8path(value);
        }
    }

    auto schemes = db_->list_settings(std::string(kSchemePrefix));
    if (!schemes.empty())
    {
        result.scheme_profiles.clear();
    }
    for (auto const &[key, value] : schemes)
    {
        if (auto scheme = key_infix(key, kSchemePrefix, kSchemeSuffix))
        {
            result.scheme_profiles[payload::normalize_scheme_name(*scheme)] =
                value;
        }
    }

    auto agents = db_->list_settings(std::string(kUserAgentPrefix));
    if (!agents.empty())
    {
        result.user_agents.clear();
    }
    for (auto const &[key, value] : agents)
    {
        auto pattern = std::string_view(key).substr(kUserAgentPrefix.size());
        if (!pattern.empty() && !value.empty())
        {
            result.user_agents.push_back({std::string(pattern), value});
        }
    }
    return result;
}

bool HandlerConfigStore::persist(HandlerConfig const &config) const
{
    if (!is_valid())
    {
        return false;
    }
    if (!db_->begin_transaction())
    {
        return false;
    }
    bool ok = db_->set_setting("logEnabled", bool_to_string(config.log_enabled));
    auto log_path = config.log_path.u8string();
    ok = ok && db_->set_setting("logPath",
                                std::string(log_path.begin(), log_path.end()));
    ok = ok && db_->set_setting("launchIntervalMs",
                                std::to_string(config.launch_interval.count()));
    for (auto const &[target, path] : config.player_paths)
    {
        auto encoded = path.u8string();
        ok = ok && db_->set_setting(make_key(kPlayerPrefix, target, kPlayerSuffix),
                                    std::string(encoded.begin(), encoded.end()));
    }
    for (auto const &[scheme, profile] : config.scheme_profiles)
    {
        ok = ok && db_->set_setting(make_key(kSchemePrefix, scheme, kSchemeSuffix),
                                    profile);
    }
    for (auto const &rule : config.user_agents)
    {
        ok = ok && db_->set_setting(make_key(kUserAgentPrefix, rule.pattern, {}),
                                    rule.user_agent);
    }
    if (!ok)
    {
        db_->rollback_transaction();
        JP_LOG_WARN("failed to persist settings to {}", db_->path().string());
        return false;
    }
    return db_->commit_transaction();
}

bool HandlerConfigStore::remove_scheme(std::string const &scheme) const
{
    if (!is_valid())
    {
        return false;
    }
    return db_->remove_setting(make_key(kSchemePrefix, scheme, kSchemeSuffix));
}

} // namespace jp::config
