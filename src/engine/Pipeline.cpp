#include "engine/Pipeline.hpp"

#include "engine/SchedulerService.hpp"
#include "engine/SourcePoller.hpp"
#include "remote/DelegatingSessionFactory.hpp"
#include "remote/InboundFileSynchronizer.hpp"
#include "remote/LocalSession.hpp"
#include "remote/StreamingMessageSource.hpp"
#include "remote/SynchronizingMessageSource.hpp"
#include "rotation/RotatingServerAdvice.hpp"
#include "rotation/StandardRotationPolicy.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

namespace tf::engine
{

namespace
{

constexpr auto kMaxIdleSleep = std::chrono::milliseconds(200);

std::unique_ptr<remote::DelegatingSessionFactory>
make_session_factory(PipelineSettings const &settings)
{
    remote::DelegatingSessionFactory::FactoryMap factories;
    std::shared_ptr<remote::SessionFactory> fallback;
    for (auto const &endpoint : settings.endpoints)
    {
        auto factory =
            std::make_shared<remote::LocalSessionFactory>(endpoint.root);
        if (settings.default_endpoint &&
            *settings.default_endpoint == endpoint.key)
        {
            fallback = factory;
        }
        factories.emplace(endpoint.key, std::move(factory));
    }
    return std::make_unique<remote::DelegatingSessionFactory>(
        std::move(factories), std::move(fallback));
}

} // namespace

struct Pipeline::Impl
{
    Impl(PipelineSettings s, Handler h)
        : settings(std::move(s)), handler(std::move(h)),
          factory(make_session_factory(settings))
    {
        if (settings.mode == TransferMode::Synchronize)
        {
            synchronizer = std::make_unique<remote::InboundFileSynchronizer>(
                factory.get());
            synchronizer->set_delete_remote_files(settings.delete_remote_files);
            auto sync_source =
                std::make_unique<remote::SynchronizingMessageSource>(
                    synchronizer.get(), settings.local_directory);
            sync_source->set_max_fetch_size(settings.max_fetch_size);
            source = std::move(sync_source);
        }
        else
        {
            auto stream_source =
                std::make_unique<remote::StreamingMessageSource>(
                    factory.get());
            stream_source->set_max_fetch_size(settings.max_fetch_size);
            source = std::move(stream_source);
        }

        policy = std::make_shared<rotation::StandardRotationPolicy>(
            factory.get(), settings.rotation, settings.fair);
        auto advice = std::make_shared<rotation::RotatingServerAdvice>(policy);

        SourcePoller::Options options;
        options.max_messages_per_poll = settings.max_messages_per_poll;
        poller = std::make_unique<SourcePoller>(
            source.get(),
            std::vector<std::shared_ptr<MessageSourceAdvice>>{advice},
            [this](remote::Message const &message) { dispatch(message); },
            options);
    }

    void dispatch(remote::Message const &message)
    {
        TF_LOG_INFO("received {} from {}:{}", message.file_name,
                    message.endpoint_key, message.remote_directory);
        if (handler)
        {
            handler(message);
        }
    }

    PipelineSettings settings;
    Handler handler;
    std::unique_ptr<remote::DelegatingSessionFactory> factory;
    std::unique_ptr<remote::InboundFileSynchronizer> synchronizer;
    std::unique_ptr<remote::MessageSource> source;
    std::shared_ptr<rotation::StandardRotationPolicy> policy;
    std::unique_ptr<SourcePoller> poller;
    SchedulerService scheduler;

    std::mutex wake_mutex;
    std::condition_variable wake;
    std::atomic_bool running{false};
    std::atomic_bool stop_requested{false};
};

Pipeline::Pipeline(PipelineSettings settings, Handler handler)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(handler)))
{
}

Pipeline::~Pipeline() = default;

std::unique_ptr<Pipeline> Pipeline::create(PipelineSettings settings,
                                           Handler handler)
{
    return std::make_unique<Pipeline>(std::move(settings), std::move(handler));
}

void Pipeline::run()
{
    impl_->running.store(true, std::memory_order_release);
    auto const task =
        impl_->poller->schedule(impl_->scheduler, impl_->settings.poll_interval);
    TF_LOG_INFO("pipeline started: {} entries, {} rotation, {} mode, every {} ms",
                impl_->settings.rotation.size(),
                impl_->settings.fair ? "fair" : "greedy",
                to_string(impl_->settings.mode),
                impl_->settings.poll_interval.count());

    while (!impl_->stop_requested.load(std::memory_order_acquire) &&
           !tf::runtime::should_shutdown())
    {
        auto now = SchedulerService::Clock::now();
        try
        {
            impl_->scheduler.tick(now);
        }
        catch (...)
        {
            impl_->scheduler.cancel(task);
            impl_->running.store(false, std::memory_order_release);
            throw;
        }
        auto wait = std::min(impl_->scheduler.time_until_next_task(
                                 SchedulerService::Clock::now()),
                             std::chrono::milliseconds(kMaxIdleSleep));
        std::unique_lock<std::mutex> lock(impl_->wake_mutex);
        impl_->wake.wait_for(lock, wait,
                             [this]
                             {
                                 return impl_->stop_requested.load(
                                     std::memory_order_acquire);
                             });
    }

    impl_->scheduler.cancel(task);
    impl_->running.store(false, std::memory_order_release);
    TF_LOG_INFO("pipeline stopped after {} message(s)",
                impl_->poller->total_received());
}

void Pipeline::stop() noexcept
{
    {
        std::lock_guard<std::mutex> guard(impl_->wake_mutex);
        impl_->stop_requested.store(true, std::memory_order_release);
    }
    impl_->wake.notify_all();
}

bool Pipeline::is_running() const noexcept
{
    return impl_->running.load(std::memory_order_acquire);
}

std::size_t Pipeline::poll_once()
{
    return impl_->poller->poll_once();
}

PipelineSettings const &Pipeline::settings() const noexcept
{
    return impl_->settings;
}

rotation::StandardRotationPolicy const &Pipeline::rotation() const noexcept
{
    return *impl_->policy;
}

std::size_t Pipeline::total_received() const noexcept
{
    return impl_->poller->total_received();
}

} // namespace tf::engine
