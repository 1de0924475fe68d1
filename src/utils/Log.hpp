#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>

namespace tf::log
{

// Appends one formatted line to tinyfetch.log under the data root. Returns
// false when the file cannot be opened.
bool append_log_line_to_file(std::string const &line);

// TF_ENABLE_LOGGING=1 takes precedence over TF_BUILD_MINIMAL so that logs can
// be switched on in minimal builds for diagnostics.
#if defined(TF_ENABLE_LOGGING) && (TF_ENABLE_LOGGING)
#define TF_LOGGING_ACTIVE 1
#elif !defined(TF_BUILD_MINIMAL)
#define TF_LOGGING_ACTIVE 1
#else
#define TF_LOGGING_ACTIVE 0
#endif

#if TF_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(32 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    // stderr may be detached when running as a service; the file copy is the
    // one that survives.
    (void)append_log_line_to_file(final);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace tf::log

#if TF_LOGGING_ACTIVE
#define TF_LOG_DEBUG(fmt, ...) tf::log::write_line('D', fmt, ##__VA_ARGS__)
#define TF_LOG_INFO(fmt, ...) tf::log::write_line('I', fmt, ##__VA_ARGS__)
#define TF_LOG_WARN(fmt, ...) tf::log::write_line('W', fmt, ##__VA_ARGS__)
#define TF_LOG_ERROR(fmt, ...) tf::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define TF_LOG_DEBUG(fmt, ...) (void)0
#define TF_LOG_INFO(fmt, ...) (void)0
#define TF_LOG_WARN(fmt, ...) (void)0
#define TF_LOG_ERROR(fmt, ...) (void)0
#endif
