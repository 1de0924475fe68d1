#include "TestUtils.hpp"
#include "engine/PipelineSettings.hpp"
#include "utils/Error.hpp"

#include <chrono>
#include <string>

#include <doctest/doctest.h>

using tf::engine::parse_pipeline_settings;

TEST_CASE("pipeline settings parse a complete configuration")
{
    auto settings = parse_pipeline_settings(R"({
        // comments are accepted
        "fair": true,
        "mode": "stream",
        "pollIntervalMs": 250,
        "maxMessagesPerPoll": 4,
        "maxFetchSize": 2,
        "localDirectory": "inbound",
        "deleteRemoteFiles": true,
        "endpoints": [
            {"key": "A", "root": "/srv/a"},
            {"key": "B", "root": "mirrors/b"},
        ],
        "rotation": [
            {"key": "A", "directory": "/in/a"},
            {"key": "B", "directory": "/in/b"}
        ]
    })",
                                            "/etc/tinyfetch");

    CHECK(settings.fair);
    CHECK(settings.mode == tf::engine::TransferMode::Stream);
    CHECK(settings.poll_interval == std::chrono::milliseconds(250));
    CHECK(settings.max_messages_per_poll == 4);
    CHECK(settings.max_fetch_size == 2);
    CHECK(settings.local_directory ==
          std::filesystem::path("/etc/tinyfetch/inbound"));
    CHECK(settings.delete_remote_files);
    REQUIRE(settings.endpoints.size() == 2);
    CHECK(settings.endpoints[0].root == std::filesystem::path("/srv/a"));
    CHECK(settings.endpoints[1].root ==
          std::filesystem::path("/etc/tinyfetch/mirrors/b"));
    REQUIRE(settings.rotation.size() == 2);
    CHECK(settings.rotation[1].key() == "B");
    CHECK(settings.rotation[1].directory() == "/in/b");
}

TEST_CASE("pipeline settings default to greedy synchronization")
{
    auto settings = parse_pipeline_settings(R"({
        "endpoints": [{"key": "A", "root": "/srv/a"}],
        "rotation": [{"key": "A", "directory": "/in"}]
    })");
    CHECK_FALSE(settings.fair);
    CHECK(settings.mode == tf::engine::TransferMode::Synchronize);
    CHECK(settings.poll_interval == std::chrono::milliseconds(1000));
    CHECK(settings.max_messages_per_poll == 1);
    CHECK_FALSE(settings.local_directory.empty());
    CHECK_FALSE(settings.default_endpoint.has_value());
}

TEST_CASE("pipeline settings reject an empty rotation list")
{
    CHECK_THROWS_WITH_AS(
        parse_pipeline_settings(R"({"rotation": []})"),
        doctest::Contains("at least one entry"), tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings(R"({"fair": true})"),
                    tf::ConfigurationError);
}

TEST_CASE("pipeline settings reject malformed input")
{
    CHECK_THROWS_WITH_AS(parse_pipeline_settings("{"),
                         doctest::Contains("invalid pipeline JSON"),
                         tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings("[]"), tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings(
                        R"({"mode": "ftp", "rotation": [{"key":"A","directory":"/"}]})"),
                    tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings(
                        R"({"pollIntervalMs": 0, "rotation": [{"key":"A","directory":"/"}]})"),
                    tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings(
                        R"({"fair": "yes", "rotation": [{"key":"A","directory":"/"}]})"),
                    tf::ConfigurationError);
    CHECK_THROWS_AS(parse_pipeline_settings(
                        R"({"rotation": [{"directory":"/"}]})"),
                    tf::ConfigurationError);
}

TEST_CASE("rotation entries must name a declared endpoint unless a default "
          "exists")
{
    CHECK_THROWS_WITH_AS(
        parse_pipeline_settings(R"({
            "endpoints": [{"key": "A", "root": "/srv/a"}],
            "rotation": [{"key": "Z", "directory": "/in"}]
        })"),
        doctest::Contains("undeclared endpoint 'Z'"), tf::ConfigurationError);

    auto settings = parse_pipeline_settings(R"({
        "defaultEndpoint": "A",
        "endpoints": [{"key": "A", "root": "/srv/a"}],
        "rotation": [{"key": "Z", "directory": "/in"}]
    })");
    CHECK(settings.default_endpoint == std::optional<std::string>("A"));
}

TEST_CASE("duplicate endpoint keys are rejected")
{
    CHECK_THROWS_AS(parse_pipeline_settings(R"({
        "endpoints": [{"key": "A", "root": "/a"}, {"key": "A", "root": "/b"}],
        "rotation": [{"key": "A", "directory": "/in"}]
    })"),
                    tf::ConfigurationError);
}

TEST_CASE("pipeline settings load from a file relative to its directory")
{
    auto root = tf::tests::make_temp_root("config-file");
    tf::tests::write_file(root / "pipeline.json", R"({
        "endpoints": [{"key": "A", "root": "share"}],
        "rotation": [{"key": "A", "directory": "/in"}],
        "localDirectory": "inbound"
    })");

    auto settings = tf::engine::load_pipeline_settings(root / "pipeline.json");
    CHECK(settings.endpoints.front().root == root / "share");
    CHECK(settings.local_directory == root / "inbound");

    CHECK_THROWS_AS(tf::engine::load_pipeline_settings(root / "missing.json"),
                    tf::ConfigurationError);
}
