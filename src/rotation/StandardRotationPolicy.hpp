#pragma once

#include "rotation/KeyDirectory.hpp"
#include "rotation/RotationCallback.hpp"
#include "rotation/RotationPolicy.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace tf::remote
{
class DelegatingSessionFactory;
}

namespace tf::rotation
{

// Round-robin over a fixed list of endpoint/directory pairs.
//
// fair == true: every before_receive moves to the next entry (the first poll
// uses entry 0), regardless of what earlier polls returned.
// fair == false: stay on the current entry while it keeps producing messages;
// after_receive moves on after the first empty poll.
//
// before_receive always selects the current key on the session factory for
// the calling thread and re-applies the directory, since the source may have
// been reconfigured between polls. after_receive clears the thread's key.
class StandardRotationPolicy final : public RotationPolicy
{
  public:
    StandardRotationPolicy(remote::DelegatingSessionFactory *factory,
                           std::vector<KeyDirectory> entries, bool fair = false,
                           RotationCallback callback = apply_remote_directory);

    void before_receive(remote::MessageSource &source) override;
    void after_receive(bool received, remote::MessageSource &source) override;

    KeyDirectory current() const;
    std::size_t position() const;
    bool fair() const noexcept { return fair_; }
    std::vector<KeyDirectory> const &entries() const noexcept
    {
        return entries_;
    }

  private:
    void advance_locked();

    remote::DelegatingSessionFactory *factory_;
    std::vector<KeyDirectory> const entries_;
    bool const fair_;
    RotationCallback callback_;

    mutable std::mutex mutex_;
    std::size_t position_ = 0;
    bool started_ = false;
};

} // namespace tf::rotation
