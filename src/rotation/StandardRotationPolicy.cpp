#include "rotation/StandardRotationPolicy.hpp"

#include "remote/DelegatingSessionFactory.hpp"
#include "utils/Error.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace tf::rotation
{

StandardRotationPolicy::StandardRotationPolicy(
    remote::DelegatingSessionFactory *factory,
    std::vector<KeyDirectory> entries, bool fair, RotationCallback callback)
    : factory_(factory), entries_(std::move(entries)), fair_(fair),
      callback_(std::move(callback))
{
    if (factory_ == nullptr)
    {
        throw ConfigurationError("rotation requires a session factory");
    }
    if (entries_.empty())
    {
        throw ConfigurationError(
            "rotation requires at least one key/directory entry");
    }
    if (!callback_)
    {
        throw ConfigurationError("rotation requires a rotation callback");
    }
}

void StandardRotationPolicy::before_receive(remote::MessageSource &source)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (fair_ && started_)
    {
        advance_locked();
    }
    started_ = true;

    auto const &selected = entries_[position_];
    TF_LOG_DEBUG("rotation: polling {}:{} (entry {}/{})", selected.key(),
                 selected.directory(), position_ + 1, entries_.size());
    factory_->set_thread_key(selected.key());
    callback_(selected.directory(), source);
}

void StandardRotationPolicy::after_receive(bool received,
                                           remote::MessageSource &)
{
    std::lock_guard<std::mutex> guard(mutex_);
    factory_->clear_thread_key();
    if (!fair_ && !received)
    {
        advance_locked();
    }
}

KeyDirectory StandardRotationPolicy::current() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_[position_];
}

std::size_t StandardRotationPolicy::position() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return position_;
}

void StandardRotationPolicy::advance_locked()
{
    position_ = (position_ + 1) % entries_.size();
}

} // namespace tf::rotation
