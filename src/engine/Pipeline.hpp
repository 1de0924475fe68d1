#pragma once

#include "engine/PipelineSettings.hpp"
#include "remote/MessageSource.hpp"

#include <cstddef>
#include <functional>
#include <memory>

namespace tf::rotation
{
class StandardRotationPolicy;
}

namespace tf::engine
{

// A configured polling pipeline: endpoint session factories, the transfer
// source selected by settings.mode, the rotating advice and a poller on a
// scheduler. Construction throws ConfigurationError on bad settings.
class Pipeline
{
  public:
    using Handler = std::function<void(remote::Message const &)>;

    explicit Pipeline(PipelineSettings settings, Handler handler = {});
    ~Pipeline();
    static std::unique_ptr<Pipeline> create(PipelineSettings settings,
                                            Handler handler = {});

    // Polls on settings.poll_interval until stop() or a process shutdown
    // request.
    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    // One poll outside the scheduler; returns messages handled.
    std::size_t poll_once();

    PipelineSettings const &settings() const noexcept;
    rotation::StandardRotationPolicy const &rotation() const noexcept;
    std::size_t total_received() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tf::engine
