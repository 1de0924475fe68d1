#include "remote/SynchronizingMessageSource.hpp"

#include "remote/InboundFileSynchronizer.hpp"
#include "utils/Error.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tf::remote
{

namespace
{

bool is_partial(std::filesystem::path const &path)
{
    std::string_view const suffix = InboundFileSynchronizer::kPartialSuffix;
    auto name = path.filename().string();
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) ==
               0;
}

} // namespace

SynchronizingMessageSource::SynchronizingMessageSource(
    InboundFileSynchronizer *synchronizer,
    std::filesystem::path local_directory)
    : synchronizer_(synchronizer), local_directory_(std::move(local_directory))
{
    if (synchronizer_ == nullptr)
    {
        throw ConfigurationError(
            "SynchronizingMessageSource requires a synchronizer");
    }
    if (local_directory_.empty())
    {
        throw ConfigurationError(
            "SynchronizingMessageSource requires a local directory");
    }
}

void SynchronizingMessageSource::set_max_fetch_size(
    std::size_t max_fetch) noexcept
{
    std::lock_guard<std::mutex> guard(mutex_);
    max_fetch_ = max_fetch;
}

DirectoryTarget SynchronizingMessageSource::directory_target()
{
    return synchronizer_;
}

std::optional<Message> SynchronizingMessageSource::receive()
{
    std::size_t max_fetch = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (pending_.empty())
        {
            scan_local_directory();
        }
        if (auto message = next_pending())
        {
            return message;
        }
        max_fetch = max_fetch_;
    }

    // No lock held across the remote transfer.
    if (synchronizer_->synchronize_to_local_directory(local_directory_,
                                                      max_fetch) == 0)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    scan_local_directory();
    return next_pending();
}

void SynchronizingMessageSource::scan_local_directory()
{
    std::error_code ec;
    std::filesystem::directory_iterator it(local_directory_, ec);
    if (ec)
    {
        // Not created until the first successful synchronization.
        return;
    }
    std::vector<std::filesystem::path> found;
    for (auto const &entry : it)
    {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || is_partial(entry.path()))
        {
            continue;
        }
        auto normalized = entry.path().lexically_normal();
        if (seen_.count(normalized.string()) != 0)
        {
            continue;
        }
        found.push_back(std::move(normalized));
    }
    std::sort(found.begin(), found.end());
    for (auto &path : found)
    {
        seen_.insert(path.string());
        pending_.push_back(std::move(path));
    }
}

std::optional<Message> SynchronizingMessageSource::next_pending()
{
    if (pending_.empty())
    {
        return std::nullopt;
    }
    auto local_file = std::move(pending_.front());
    pending_.pop_front();

    Message message;
    message.file_name = local_file.filename().string();
    if (auto origin = synchronizer_->take_origin(local_file))
    {
        message.endpoint_key = origin->endpoint_key;
        message.remote_directory = origin->remote_directory;
        message.file_name = origin->file_name;
    }
    message.local_file = std::move(local_file);
    return message;
}

} // namespace tf::remote
