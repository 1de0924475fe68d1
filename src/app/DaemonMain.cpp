#include "app/DaemonMain.hpp"

#include "engine/Pipeline.hpp"
#include "engine/PipelineSettings.hpp"
#include "rotation/StandardRotationPolicy.hpp"
#include "utils/Error.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <thread>

namespace tf::app
{

namespace
{

struct CommandLine
{
    std::optional<std::filesystem::path> config_path;
    bool force_fair = false;
    bool show_version = false;
    int run_seconds = 0;
};

std::optional<int> parse_seconds(std::string const &value)
{
    if (value.empty())
    {
        return std::nullopt;
    }
    char *end = nullptr;
    errno = 0;
    auto parsed = std::strtol(value.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE || parsed < 0 ||
        parsed > std::numeric_limits<int>::max())
    {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

CommandLine parse_command_line(int argc, char *argv[])
{
    CommandLine cli;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
            continue;
        std::string arg = argv[index];
        if (arg == "--fair")
        {
            cli.force_fair = true;
        }
        else if (arg == "--version")
        {
            cli.show_version = true;
        }
        else if (arg.rfind("--run-seconds=", 0) == 0)
        {
            auto seconds = parse_seconds(arg.substr(14));
            if (!seconds)
            {
                throw ConfigurationError("--run-seconds expects a number");
            }
            cli.run_seconds = *seconds;
        }
        else if (arg == "--run-seconds")
        {
            // Without a number, default to 5s.
            std::optional<int> seconds;
            if (index + 1 < argc && argv[index + 1] &&
                argv[index + 1][0] != '-')
            {
                seconds = parse_seconds(argv[++index]);
                if (!seconds)
                {
                    throw ConfigurationError("--run-seconds expects a number");
                }
            }
            cli.run_seconds = seconds.value_or(5);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw ConfigurationError("unknown option " + arg);
        }
        else if (!cli.config_path)
        {
            cli.config_path = std::filesystem::path(arg);
        }
        else
        {
            throw ConfigurationError("only one configuration file is accepted");
        }
    }
    if (!cli.config_path)
    {
        if (auto env = std::getenv("TF_CONFIG"); env && *env)
        {
            cli.config_path = std::filesystem::path(env);
        }
    }
    return cli;
}

} // namespace

int daemon_main(int argc, char *argv[])
{
    try
    {
        tf::runtime::install_signal_handlers();

        auto cli = parse_command_line(argc, argv);
        if (cli.show_version)
        {
            tf::log::print_status("{}", tf::version::kDisplayVersion);
            return 0;
        }
        if (!cli.config_path)
        {
            tf::log::print_status(
                "usage: tinyfetch [--fair] [--run-seconds N] <pipeline.json>");
            return 2;
        }

        auto settings = tf::engine::load_pipeline_settings(*cli.config_path);
        if (cli.force_fair)
        {
            settings.fair = true;
        }
        TF_LOG_INFO("{} loading {}", tf::version::kDisplayVersion,
                    cli.config_path->string());

        auto pipeline = tf::engine::Pipeline::create(std::move(settings));
        for (auto const &entry : pipeline->rotation().entries())
        {
            TF_LOG_INFO("  rotation entry {} -> {}", entry.key(),
                        entry.directory());
        }

        std::exception_ptr poll_failure;
        std::atomic_bool poll_finished{false};
        std::thread poll_thread(
            [&, p = pipeline.get()]
            {
                try
                {
                    p->run();
                }
                catch (...)
                {
                    // Rethrown on the main thread after join.
                    poll_failure = std::current_exception();
                }
                poll_finished.store(true, std::memory_order_release);
            });
        tf::log::print_status("TinyFetch running; CTRL+C to stop.");

        auto const started = std::chrono::steady_clock::now();
        auto const deadline = started + std::chrono::seconds(cli.run_seconds);
        while (!tf::runtime::should_shutdown() &&
               !poll_finished.load(std::memory_order_acquire))
        {
            if (cli.run_seconds > 0 &&
                std::chrono::steady_clock::now() >= deadline)
            {
                TF_LOG_INFO("Auto shutdown: run-seconds={} reached",
                            cli.run_seconds);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        pipeline->stop();
        if (poll_thread.joinable())
        {
            poll_thread.join();
        }
        if (poll_failure)
        {
            std::rethrow_exception(poll_failure);
        }
        tf::log::print_status("Shutdown complete; {} message(s) received.",
                              pipeline->total_received());
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "TinyFetch failed: %s\n", ex.what());
        TF_LOG_ERROR("TinyFetch failed: {}", ex.what());
    }
    return 1;
}

} // namespace tf::app
