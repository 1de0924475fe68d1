#include "remote/DelegatingSessionFactory.hpp"

#include "utils/Log.hpp"

#include <utility>

namespace tf::remote
{

DelegatingSessionFactory::DelegatingSessionFactory(
    FactoryMap factories, std::shared_ptr<SessionFactory> default_factory)
    : factories_(std::move(factories)),
      default_factory_(std::move(default_factory))
{
}

void DelegatingSessionFactory::add_factory(
    std::string key, std::shared_ptr<SessionFactory> factory)
{
    std::unique_lock<std::shared_mutex> lock(factories_mutex_);
    factories_[std::move(key)] = std::move(factory);
}

bool DelegatingSessionFactory::has_factory(std::string const &key) const
{
    std::shared_lock<std::shared_mutex> lock(factories_mutex_);
    return factories_.find(key) != factories_.end();
}

std::shared_ptr<SessionFactory>
DelegatingSessionFactory::factory_for(std::string const &key) const
{
    std::shared_lock<std::shared_mutex> lock(factories_mutex_);
    auto it = factories_.find(key);
    if (it == factories_.end() || !it->second)
    {
        return default_factory_;
    }
    return it->second;
}

void DelegatingSessionFactory::set_thread_key(std::string key)
{
    std::lock_guard<std::mutex> guard(keys_mutex_);
    thread_keys_[std::this_thread::get_id()] = std::move(key);
}

void DelegatingSessionFactory::clear_thread_key()
{
    std::lock_guard<std::mutex> guard(keys_mutex_);
    thread_keys_.erase(std::this_thread::get_id());
}

std::optional<std::string> DelegatingSessionFactory::thread_key() const
{
    std::lock_guard<std::mutex> guard(keys_mutex_);
    auto it = thread_keys_.find(std::this_thread::get_id());
    if (it == thread_keys_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<SessionFactory>
DelegatingSessionFactory::resolve_for_current_thread() const
{
    auto key = thread_key();
    if (!key)
    {
        return default_factory_;
    }
    auto factory = factory_for(*key);
    if (!factory)
    {
        TF_LOG_WARN("no session factory for endpoint '{}' and no default",
                    *key);
    }
    return factory;
}

std::unique_ptr<Session> DelegatingSessionFactory::get_session()
{
    auto factory = resolve_for_current_thread();
    if (!factory)
    {
        return nullptr;
    }
    return factory->get_session();
}

} // namespace tf::remote
