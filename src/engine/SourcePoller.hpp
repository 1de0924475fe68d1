#pragma once

#include "engine/MessageSourceAdvice.hpp"
#include "engine/SchedulerService.hpp"
#include "remote/MessageSource.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace tf::engine
{

// Drives a message source: each poll runs up to max_messages_per_poll
// receives, stopping at the first empty one. Every receive is wrapped by the
// advice chain (before hooks in order, after hooks in reverse order).
class SourcePoller
{
  public:
    using Handler = std::function<void(remote::Message const &)>;

    struct Options
    {
        std::size_t max_messages_per_poll = 1;
    };

    SourcePoller(remote::MessageSource *source,
                 std::vector<std::shared_ptr<MessageSourceAdvice>> advices,
                 Handler handler, Options options = {});

    // Returns how many messages reached the handler.
    std::size_t poll_once();

    // Registers poll_once() on the scheduler. A failed poll is logged and the
    // task stays scheduled; ConfigurationError propagates out of tick().
    SchedulerService::TaskId schedule(SchedulerService &scheduler,
                                      std::chrono::milliseconds interval);

    std::size_t total_received() const noexcept
    {
        return total_received_.load(std::memory_order_relaxed);
    }

  private:
    bool receive_one();

    remote::MessageSource *source_;
    std::vector<std::shared_ptr<MessageSourceAdvice>> advices_;
    Handler handler_;
    Options options_;
    std::atomic<std::size_t> total_received_{0};
};

} // namespace tf::engine
