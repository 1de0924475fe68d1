#include "TestUtils.hpp"
#include "app/DaemonMain.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{

int run_daemon(std::vector<std::string> args)
{
    args.insert(args.begin(), "tinyfetch");
    std::vector<char *> argv;
    for (auto &arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return tf::app::daemon_main(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST_CASE("daemon polls a configured pipeline and exits after run-seconds")
{
    auto root = tf::tests::make_temp_root("daemon-smoke");
    tf::tests::write_file(root / "share" / "in" / "hello.txt", "hello");
    tf::tests::write_file(root / "pipeline.json", R"({
        "pollIntervalMs": 20,
        "localDirectory": "inbound",
        "endpoints": [{"key": "share", "root": "share"}],
        "rotation": [{"key": "share", "directory": "/in"}]
    })");

    CHECK(run_daemon({(root / "pipeline.json").string(), "--run-seconds=1"}) ==
          0);
    CHECK(tf::tests::read_file(root / "inbound" / "hello.txt") == "hello");
}

TEST_CASE("daemon reports configuration errors with a failing exit code")
{
    auto root = tf::tests::make_temp_root("daemon-bad-config");
    tf::tests::write_file(root / "pipeline.json", R"({"rotation": []})");
    CHECK(run_daemon({(root / "pipeline.json").string()}) == 1);
    CHECK(run_daemon({"--bogus"}) == 1);
}

TEST_CASE("daemon prints its version")
{
    CHECK(run_daemon({"--version"}) == 0);
}

TEST_CASE("daemon rejects run-seconds beyond the int range")
{
    CHECK(run_daemon({"--run-seconds=3000000000", "pipeline.json"}) == 1);
    CHECK(run_daemon({"--run-seconds", "99999999999999999999"}) == 1);
    CHECK(run_daemon({"--run-seconds=-4"}) == 1);
}
