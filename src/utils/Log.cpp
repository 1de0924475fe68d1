#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace tf::log
{

bool append_log_line_to_file(std::string const &line)
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;

    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = tf::utils::data_root() / "tinyfetch.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (!s_ofs.is_open())
    {
        return false;
    }
    s_ofs << line << '\n';
    s_ofs.flush();
    return static_cast<bool>(s_ofs);
}

} // namespace tf::log
