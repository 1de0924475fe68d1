#include "TestUtils.hpp"
#include "engine/Pipeline.hpp"
#include "rotation/StandardRotationPolicy.hpp"
#include "utils/Error.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

namespace
{

tf::engine::PipelineSettings two_share_settings(std::filesystem::path const &root)
{
    tf::tests::write_file(root / "east" / "drop" / "e1.csv", "east-1");
    tf::tests::write_file(root / "east" / "drop" / "e2.csv", "east-2");
    tf::tests::write_file(root / "west" / "outbox" / "w1.csv", "west-1");

    tf::engine::PipelineSettings settings;
    settings.endpoints = {{"east", root / "east"}, {"west", root / "west"}};
    settings.rotation = {{"east", "/drop"}, {"west", "/outbox"}};
    settings.local_directory = root / "inbound";
    settings.poll_interval = std::chrono::milliseconds(10);
    return settings;
}

} // namespace

TEST_CASE("pipeline polls every endpoint in greedy synchronize mode")
{
    auto root = tf::tests::make_temp_root("pipeline-sync");
    std::vector<std::string> names;
    auto pipeline = tf::engine::Pipeline::create(
        two_share_settings(root),
        [&names](tf::remote::Message const &message)
        { names.push_back(message.endpoint_key + ":" + message.file_name); });

    for (int i = 0; i < 6; ++i)
    {
        pipeline->poll_once();
    }
    CHECK(names ==
          std::vector<std::string>{"east:e1.csv", "east:e2.csv", "west:w1.csv"});
    CHECK(tf::tests::read_file(root / "inbound" / "w1.csv") == "west-1");
    CHECK(pipeline->total_received() == 3);
}

TEST_CASE("pipeline in fair stream mode interleaves endpoints")
{
    auto root = tf::tests::make_temp_root("pipeline-stream");
    auto settings = two_share_settings(root);
    settings.fair = true;
    settings.mode = tf::engine::TransferMode::Stream;

    std::vector<std::string> contents;
    auto pipeline = tf::engine::Pipeline::create(
        std::move(settings),
        [&contents](tf::remote::Message const &message)
        { contents.push_back(tf::tests::as_string(message.content)); });

    CHECK(pipeline->rotation().fair());
    for (int i = 0; i < 4; ++i)
    {
        pipeline->poll_once();
    }
    CHECK(contents ==
          std::vector<std::string>{"east-1", "west-1", "east-2"});
    CHECK_FALSE(std::filesystem::exists(root / "inbound"));
}

TEST_CASE("pipeline run loop polls on its interval until stopped")
{
    auto root = tf::tests::make_temp_root("pipeline-run");
    std::mutex mutex;
    std::vector<std::string> names;
    auto pipeline = tf::engine::Pipeline::create(
        two_share_settings(root),
        [&](tf::remote::Message const &message)
        {
            std::lock_guard<std::mutex> guard(mutex);
            names.push_back(message.file_name);
        });

    std::thread runner([&pipeline] { pipeline->run(); });
    auto const deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pipeline->total_received() < 3 &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    pipeline->stop();
    runner.join();

    CHECK_FALSE(pipeline->is_running());
    std::lock_guard<std::mutex> guard(mutex);
    CHECK(names.size() == 3);
}

TEST_CASE("pipeline construction rejects an empty rotation")
{
    auto root = tf::tests::make_temp_root("pipeline-empty");
    auto settings = two_share_settings(root);
    settings.rotation.clear();
    CHECK_THROWS_AS(tf::engine::Pipeline::create(std::move(settings)),
                    tf::ConfigurationError);
}
