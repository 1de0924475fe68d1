#pragma once

#include "engine/MessageSourceAdvice.hpp"
#include "rotation/KeyDirectory.hpp"
#include "rotation/RotationPolicy.hpp"

#include <memory>
#include <vector>

namespace tf::remote
{
class DelegatingSessionFactory;
}

namespace tf::rotation
{

// Poller advice that rotates a source across several endpoints/directories.
// The poll itself is never suppressed.
class RotatingServerAdvice final : public engine::MessageSourceAdvice
{
  public:
    // Rotates to the next entry after an empty poll, or on every poll when
    // fair is set.
    RotatingServerAdvice(remote::DelegatingSessionFactory *factory,
                         std::vector<KeyDirectory> entries, bool fair = false);
    explicit RotatingServerAdvice(std::shared_ptr<RotationPolicy> policy);

    bool before_receive(remote::MessageSource &source) override;
    std::optional<remote::Message>
    after_receive(std::optional<remote::Message> result,
                  remote::MessageSource &source) override;

    RotationPolicy &policy() const noexcept { return *policy_; }

  private:
    std::shared_ptr<RotationPolicy> policy_;
};

} // namespace tf::rotation
