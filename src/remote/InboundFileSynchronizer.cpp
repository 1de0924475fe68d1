#include "remote/InboundFileSynchronizer.hpp"

#include "remote/DelegatingSessionFactory.hpp"
#include "utils/Error.hpp"
#include "utils/Log.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace tf::remote
{

namespace
{

std::string fetch_identity(std::optional<std::string> const &key,
                           std::string const &path)
{
    return key.value_or(std::string()) + "|" + path;
}

// First free name out of "name", "key-name", "key-2-name", ...
std::filesystem::path unique_local_target(std::filesystem::path const &local_dir,
                                          std::string const &key,
                                          std::string const &name)
{
    std::error_code ec;
    auto target = local_dir / name;
    if (!std::filesystem::exists(target, ec))
    {
        return target;
    }
    auto const prefix = key.empty() ? std::string("default") : key;
    target = local_dir / (prefix + "-" + name);
    for (int attempt = 2; std::filesystem::exists(target, ec); ++attempt)
    {
        target = local_dir /
                 (prefix + "-" + std::to_string(attempt) + "-" + name);
    }
    return target;
}

} // namespace

InboundFileSynchronizer::InboundFileSynchronizer(
    DelegatingSessionFactory *factory)
    : factory_(factory)
{
    if (factory_ == nullptr)
    {
        throw ConfigurationError(
            "InboundFileSynchronizer requires a session factory");
    }
}

void InboundFileSynchronizer::set_remote_directory(std::string directory)
{
    std::lock_guard<std::mutex> guard(mutex_);
    remote_directory_ = std::move(directory);
}

std::string InboundFileSynchronizer::remote_directory() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return remote_directory_;
}

void InboundFileSynchronizer::set_delete_remote_files(bool enabled)
{
    std::lock_guard<std::mutex> guard(mutex_);
    delete_remote_files_ = enabled;
}

std::size_t InboundFileSynchronizer::synchronize_to_local_directory(
    std::filesystem::path const &local_dir, std::size_t max_fetch)
{
    auto directory = remote_directory();
    if (directory.empty())
    {
        TF_LOG_WARN("synchronize skipped: no remote directory selected");
        return 0;
    }
    auto session = factory_->get_session();
    if (!session)
    {
        return 0;
    }
    auto listing = session->list(directory);
    if (!listing)
    {
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(local_dir, ec);
    if (ec)
    {
        TF_LOG_ERROR("cannot create local directory {}: {}",
                     local_dir.string(), ec.message());
        return 0;
    }

    auto const key = factory_->thread_key();
    FileOrigin origin{key.value_or(std::string()), directory, {}};
    std::size_t copied = 0;
    for (auto const &file : *listing)
    {
        if (max_fetch != 0 && copied >= max_fetch)
        {
            break;
        }
        auto identity = fetch_identity(key, file.path);
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (fetched_.count(identity) != 0)
            {
                continue;
            }
        }
        origin.file_name = file.name;
        if (!copy_one(*session, file, local_dir, origin))
        {
            continue;
        }
        {
            std::lock_guard<std::mutex> guard(mutex_);
            fetched_.insert(std::move(identity));
        }
        ++copied;
    }
    if (copied > 0)
    {
        TF_LOG_DEBUG("synchronized {} file(s) from {}:{}", copied,
                     key.value_or("<default>"), directory);
    }
    return copied;
}

std::optional<InboundFileSynchronizer::FileOrigin>
InboundFileSynchronizer::origin_of(std::filesystem::path const &local_file) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = origins_.find(local_file.lexically_normal().string());
    if (it == origins_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<InboundFileSynchronizer::FileOrigin>
InboundFileSynchronizer::take_origin(std::filesystem::path const &local_file)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = origins_.find(local_file.lexically_normal().string());
    if (it == origins_.end())
    {
        return std::nullopt;
    }
    auto origin = std::move(it->second);
    origins_.erase(it);
    return origin;
}

bool InboundFileSynchronizer::copy_one(Session &session, RemoteFile const &file,
                                       std::filesystem::path const &local_dir,
                                       FileOrigin const &origin)
{
    auto content = session.read(file.path);
    if (!content)
    {
        return false;
    }
    auto target = unique_local_target(local_dir, origin.endpoint_key, file.name);
    if (target.filename().string() != file.name)
    {
        TF_LOG_INFO("{} already exists locally; storing {}:{} as {}", file.name,
                    origin.endpoint_key, file.path,
                    target.filename().string());
    }
    auto temp = target;
    temp += kPartialSuffix;
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            TF_LOG_ERROR("cannot write {}", temp.string());
            return false;
        }
        output.write(reinterpret_cast<char const *>(content->data()),
                     static_cast<std::streamsize>(content->size()));
        if (!output)
        {
            TF_LOG_ERROR("short write to {}", temp.string());
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        TF_LOG_ERROR("cannot move {} into place: {}", target.string(),
                     ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }

    bool delete_remote = false;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        delete_remote = delete_remote_files_;
        origins_[target.lexically_normal().string()] = origin;
    }
    if (delete_remote && !session.remove(file.path))
    {
        TF_LOG_WARN("copied {} but could not delete it remotely", file.path);
    }
    return true;
}

} // namespace tf::remote
