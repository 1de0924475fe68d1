#include "utils/Shutdown.hpp"

#include <atomic>
#include <csignal>

namespace tf::runtime
{

namespace
{
std::atomic_bool g_shutdown_requested{false};
} // namespace

void request_shutdown() noexcept
{
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept
{
    return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_signal_handlers() noexcept
{
    std::signal(SIGINT, [](int) { request_shutdown(); });
    std::signal(SIGTERM, [](int) { request_shutdown(); });
}

} // namespace tf::runtime
