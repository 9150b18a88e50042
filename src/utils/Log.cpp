#include "utils/Log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

namespace jp::log
{

namespace
{
std::mutex s_mutex;
std::ofstream s_ofs;
std::filesystem::path s_path;
bool s_enabled = false;
} // namespace

void configure_file_sink(bool enabled, std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_enabled = enabled && !path.empty();
    s_path = std::move(path);
}

bool file_sink_enabled()
{
    std::lock_guard<std::mutex> lk(s_mutex);
    return s_enabled;
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_enabled)
    {
        return;
    }
    if (!s_ofs.is_open())
    {
        auto parent = s_path.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        s_ofs.open(s_path, std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace jp::log
