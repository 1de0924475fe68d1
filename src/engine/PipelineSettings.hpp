#pragma once

#include "rotation/KeyDirectory.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tf::engine
{

enum class TransferMode
{
    // Copy remote files into local_directory, emit local paths.
    Synchronize = 0,
    // Read remote files straight into message content.
    Stream = 1,
};

struct EndpointSettings
{
    std::string key;
    std::filesystem::path root;
};

struct PipelineSettings
{
    bool fair = false;
    TransferMode mode = TransferMode::Synchronize;
    std::chrono::milliseconds poll_interval{1000};
    std::size_t max_messages_per_poll = 1;
    std::size_t max_fetch_size = 0;
    std::filesystem::path local_directory;
    bool delete_remote_files = false;
    std::optional<std::string> default_endpoint;
    std::vector<EndpointSettings> endpoints;
    std::vector<rotation::KeyDirectory> rotation;
};

// Both throw ConfigurationError describing the first problem found.
// Relative endpoint roots and local_directory are resolved against base_dir.
PipelineSettings
parse_pipeline_settings(std::string_view payload,
                        std::filesystem::path const &base_dir = {});
PipelineSettings
load_pipeline_settings(std::filesystem::path const &path);

std::string_view to_string(TransferMode mode) noexcept;

} // namespace tf::engine
