#pragma once

#include "remote/MessageSource.hpp"

#include <optional>

namespace tf::engine
{

// Hook pair the poller wraps around every receive.
class MessageSourceAdvice
{
  public:
    virtual ~MessageSourceAdvice() = default;

    // Returning false skips this receive.
    virtual bool before_receive(remote::MessageSource &source) = 0;

    // May inspect or replace the result before it reaches the handler.
    virtual std::optional<remote::Message>
    after_receive(std::optional<remote::Message> result,
                  remote::MessageSource &source) = 0;
};

} // namespace tf::engine
