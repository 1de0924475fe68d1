#include "engine/SourcePoller.hpp"

#include "utils/Error.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace tf::engine
{

SourcePoller::SourcePoller(
    remote::MessageSource *source,
    std::vector<std::shared_ptr<MessageSourceAdvice>> advices, Handler handler,
    Options options)
    : source_(source), advices_(std::move(advices)),
      handler_(std::move(handler)), options_(options)
{
    if (source_ == nullptr)
    {
        throw ConfigurationError("poller requires a message source");
    }
    for (auto const &advice : advices_)
    {
        if (!advice)
        {
            throw ConfigurationError("poller advice cannot be null");
        }
    }
    if (options_.max_messages_per_poll == 0)
    {
        options_.max_messages_per_poll = 1;
    }
}

std::size_t SourcePoller::poll_once()
{
    std::size_t handled = 0;
    while (handled < options_.max_messages_per_poll)
    {
        if (!receive_one())
        {
            break;
        }
        ++handled;
    }
    total_received_.fetch_add(handled, std::memory_order_relaxed);
    return handled;
}

bool SourcePoller::receive_one()
{
    for (auto const &advice : advices_)
    {
        if (!advice->before_receive(*source_))
        {
            return false;
        }
    }

    auto result = source_->receive();

    for (auto it = advices_.rbegin(); it != advices_.rend(); ++it)
    {
        result = (*it)->after_receive(std::move(result), *source_);
    }
    if (!result)
    {
        return false;
    }
    if (handler_)
    {
        handler_(*result);
    }
    return true;
}

SchedulerService::TaskId
SourcePoller::schedule(SchedulerService &scheduler,
                       std::chrono::milliseconds interval)
{
    return scheduler.schedule(interval,
                              [this]
                              {
                                  try
                                  {
                                      poll_once();
                                  }
                                  catch (ConfigurationError const &)
                                  {
                                      throw;
                                  }
                                  catch (std::exception const &ex)
                                  {
                                      TF_LOG_ERROR("poll failed: {}",
                                                   ex.what());
                                  }
                              });
}

} // namespace tf::engine
