#pragma once

namespace tf::runtime
{

// Process-wide stop flag set from signal handlers and polled by the daemon
// loop.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void install_signal_handlers() noexcept;

} // namespace tf::runtime
