#include "rotation/RotatingServerAdvice.hpp"

#include "rotation/StandardRotationPolicy.hpp"
#include "utils/Error.hpp"

#include <utility>

namespace tf::rotation
{

RotatingServerAdvice::RotatingServerAdvice(
    remote::DelegatingSessionFactory *factory, std::vector<KeyDirectory> entries,
    bool fair)
    : RotatingServerAdvice(std::make_shared<StandardRotationPolicy>(
          factory, std::move(entries), fair))
{
}

RotatingServerAdvice::RotatingServerAdvice(
    std::shared_ptr<RotationPolicy> policy)
    : policy_(std::move(policy))
{
    if (!policy_)
    {
        throw ConfigurationError("rotation policy cannot be null");
    }
}

bool RotatingServerAdvice::before_receive(remote::MessageSource &source)
{
    policy_->before_receive(source);
    return true;
}

std::optional<remote::Message>
RotatingServerAdvice::after_receive(std::optional<remote::Message> result,
                                    remote::MessageSource &source)
{
    policy_->after_receive(result.has_value(), source);
    return result;
}

} // namespace tf::rotation
