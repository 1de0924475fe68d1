#include "remote/LocalSession.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace tf::remote
{

std::string join_remote_path(std::string const &directory,
                             std::string const &name)
{
    if (directory.empty())
    {
        return name;
    }
    if (directory.back() == '/')
    {
        return directory + name;
    }
    return directory + "/" + name;
}

LocalSession::LocalSession(std::filesystem::path root) : root_(std::move(root))
{
}

std::optional<std::filesystem::path>
LocalSession::resolve(std::string const &path) const
{
    auto relative = std::filesystem::path(path).relative_path();
    auto candidate = (root_ / relative).lexically_normal();
    auto const normalized_root = root_.lexically_normal();
    auto mismatch =
        std::mismatch(normalized_root.begin(), normalized_root.end(),
                      candidate.begin(), candidate.end());
    // A trailing empty element is what "root/" normalizes to.
    if (mismatch.first != normalized_root.end() &&
        !mismatch.first->empty())
    {
        TF_LOG_WARN("remote path {} escapes endpoint root {}", path,
                    root_.string());
        return std::nullopt;
    }
    return candidate;
}

std::optional<std::vector<RemoteFile>>
LocalSession::list(std::string const &directory)
{
    auto resolved = resolve(directory);
    if (!resolved)
    {
        return std::nullopt;
    }
    std::error_code ec;
    std::filesystem::directory_iterator it(*resolved, ec);
    if (ec)
    {
        TF_LOG_WARN("cannot list {}: {}", directory, ec.message());
        return std::nullopt;
    }

    std::vector<RemoteFile> files;
    for (auto const &entry : it)
    {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec))
        {
            continue;
        }
        RemoteFile file;
        file.name = entry.path().filename().string();
        file.path = join_remote_path(directory, file.name);
        auto size = entry.file_size(entry_ec);
        file.size = entry_ec ? 0 : static_cast<std::uint64_t>(size);
        auto write_time = entry.last_write_time(entry_ec);
        if (!entry_ec)
        {
            file.modified = std::chrono::time_point_cast<
                std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(write_time));
        }
        files.push_back(std::move(file));
    }
    // Directory iteration order is unspecified; callers expect a stable one.
    std::sort(files.begin(), files.end(),
              [](RemoteFile const &a, RemoteFile const &b)
              { return a.name < b.name; });
    return files;
}

std::optional<std::vector<std::uint8_t>>
LocalSession::read(std::string const &path)
{
    auto resolved = resolve(path);
    if (!resolved)
    {
        return std::nullopt;
    }
    std::ifstream input(*resolved, std::ios::binary);
    if (!input)
    {
        TF_LOG_WARN("cannot open remote file {}", path);
        return std::nullopt;
    }
    std::vector<std::uint8_t> buffer((std::istreambuf_iterator<char>(input)),
                                     std::istreambuf_iterator<char>());
    if (input.bad())
    {
        TF_LOG_WARN("read failed for remote file {}", path);
        return std::nullopt;
    }
    return buffer;
}

bool LocalSession::remove(std::string const &path)
{
    auto resolved = resolve(path);
    if (!resolved)
    {
        return false;
    }
    std::error_code ec;
    auto removed = std::filesystem::remove(*resolved, ec);
    if (ec)
    {
        TF_LOG_WARN("cannot remove remote file {}: {}", path, ec.message());
        return false;
    }
    return removed;
}

LocalSessionFactory::LocalSessionFactory(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::unique_ptr<Session> LocalSessionFactory::get_session()
{
    return std::make_unique<LocalSession>(root_);
}

} // namespace tf::remote
