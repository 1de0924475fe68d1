#pragma once

namespace tf::remote
{
class MessageSource;
}

namespace tf::rotation
{

// Decides which endpoint/directory the next poll reads from.
class RotationPolicy
{
  public:
    virtual ~RotationPolicy() = default;

    // Called right before a receive. Must leave the current selection applied
    // to the source. Never vetoes the poll.
    virtual void before_receive(remote::MessageSource &source) = 0;

    // Called after the receive; received is true iff it produced a message.
    virtual void after_receive(bool received,
                               remote::MessageSource &source) = 0;
};

} // namespace tf::rotation
