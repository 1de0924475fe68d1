#include "remote/StreamingMessageSource.hpp"

#include "remote/DelegatingSessionFactory.hpp"
#include "utils/Error.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace tf::remote
{

StreamingMessageSource::StreamingMessageSource(
    DelegatingSessionFactory *factory)
    : factory_(factory)
{
    if (factory_ == nullptr)
    {
        throw ConfigurationError(
            "StreamingMessageSource requires a session factory");
    }
}

void StreamingMessageSource::set_remote_directory(std::string directory)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (remote_directory_ != directory)
    {
        buffered_.clear();
    }
    remote_directory_ = std::move(directory);
}

std::string StreamingMessageSource::remote_directory() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return remote_directory_;
}

void StreamingMessageSource::set_max_fetch_size(std::size_t max_fetch) noexcept
{
    std::lock_guard<std::mutex> guard(mutex_);
    max_fetch_ = max_fetch;
}

DirectoryTarget StreamingMessageSource::directory_target()
{
    return this;
}

std::optional<Message> StreamingMessageSource::receive()
{
    auto session = factory_->get_session();
    if (!session)
    {
        return std::nullopt;
    }
    auto const key = factory_->thread_key().value_or(std::string());

    RemoteFile file;
    std::string directory;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        directory = remote_directory_;
        if (directory.empty())
        {
            TF_LOG_WARN("stream receive skipped: no remote directory selected");
            return std::nullopt;
        }
        if (buffered_key_ != key)
        {
            buffered_.clear();
            buffered_key_ = key;
        }
        if (buffered_.empty())
        {
            refill(*session, directory, key);
        }
        if (buffered_.empty())
        {
            return std::nullopt;
        }
        file = std::move(buffered_.front());
        buffered_.pop_front();
    }

    auto content = session->read(file.path);
    if (!content)
    {
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        seen_.insert(key + "|" + file.path);
    }
    Message message;
    message.endpoint_key = key;
    message.remote_directory = std::move(directory);
    message.file_name = std::move(file.name);
    message.content = std::move(*content);
    return message;
}

void StreamingMessageSource::refill(Session &session,
                                    std::string const &directory,
                                    std::string const &key)
{
    auto listing = session.list(directory);
    if (!listing)
    {
        return;
    }
    for (auto &file : *listing)
    {
        if (max_fetch_ != 0 && buffered_.size() >= max_fetch_)
        {
            break;
        }
        if (seen_.count(key + "|" + file.path) != 0)
        {
            continue;
        }
        buffered_.push_back(std::move(file));
    }
}

} // namespace tf::remote
