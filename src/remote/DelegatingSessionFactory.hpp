#pragma once

#include "remote/Session.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tf::remote
{

// Routes get_session() to one of several endpoint factories. The endpoint is
// chosen per calling thread with set_thread_key(), so pollers on different
// threads can target different endpoints through the same factory.
class DelegatingSessionFactory final : public SessionFactory
{
  public:
    using FactoryMap =
        std::unordered_map<std::string, std::shared_ptr<SessionFactory>>;

    explicit DelegatingSessionFactory(
        FactoryMap factories,
        std::shared_ptr<SessionFactory> default_factory = nullptr);

    void add_factory(std::string key, std::shared_ptr<SessionFactory> factory);
    bool has_factory(std::string const &key) const;
    std::shared_ptr<SessionFactory> factory_for(std::string const &key) const;

    void set_thread_key(std::string key);
    void clear_thread_key();
    std::optional<std::string> thread_key() const;

    // Session for the calling thread's key, or from the default factory when
    // no key is set or the key is unknown. nullptr when neither resolves.
    std::unique_ptr<Session> get_session() override;

  private:
    std::shared_ptr<SessionFactory> resolve_for_current_thread() const;

    mutable std::shared_mutex factories_mutex_;
    FactoryMap factories_;
    std::shared_ptr<SessionFactory> default_factory_;

    mutable std::mutex keys_mutex_;
    std::unordered_map<std::thread::id, std::string> thread_keys_;
};

} // namespace tf::remote
