#include "engine/PipelineSettings.hpp"

#include "utils/Error.hpp"
#include "utils/FS.hpp"
#include "utils/Json.hpp"

#include <format>
#include <unordered_set>
#include <utility>

namespace tf::engine
{

namespace
{

std::filesystem::path resolve_against(std::filesystem::path const &base,
                                      std::filesystem::path value)
{
    if (value.is_relative() && !base.empty())
    {
        return base / value;
    }
    return value;
}

std::size_t read_count(yyjson_val *root, char const *key,
                       std::size_t fallback)
{
    if (!tf::json::has_member(root, key))
    {
        return fallback;
    }
    auto value = tf::json::int_member(root, key);
    if (!value || *value < 0)
    {
        throw ConfigurationError(
            std::format("'{}' must be a non-negative integer", key));
    }
    return static_cast<std::size_t>(*value);
}

bool read_flag(yyjson_val *root, char const *key, bool fallback)
{
    if (!tf::json::has_member(root, key))
    {
        return fallback;
    }
    auto value = tf::json::bool_member(root, key);
    if (!value)
    {
        throw ConfigurationError(std::format("'{}' must be a boolean", key));
    }
    return *value;
}

std::vector<EndpointSettings> read_endpoints(yyjson_val *root,
                                             std::filesystem::path const &base)
{
    std::vector<EndpointSettings> endpoints;
    auto *array = yyjson_obj_get(root, "endpoints");
    if (array == nullptr)
    {
        return endpoints;
    }
    if (!yyjson_is_arr(array))
    {
        throw ConfigurationError("'endpoints' must be an array");
    }
    std::unordered_set<std::string> keys;
    std::size_t index = 0;
    std::size_t count = 0;
    yyjson_val *item = nullptr;
    yyjson_arr_foreach(array, index, count, item)
    {
        auto key = tf::json::string_member(item, "key");
        auto root_dir = tf::json::string_member(item, "root");
        if (!key || key->empty() || !root_dir || root_dir->empty())
        {
            throw ConfigurationError(std::format(
                "endpoint #{} needs non-empty 'key' and 'root'", index));
        }
        if (!keys.insert(*key).second)
        {
            throw ConfigurationError(
                std::format("endpoint '{}' is declared twice", *key));
        }
        endpoints.push_back(
            {std::move(*key), resolve_against(base, std::move(*root_dir))});
    }
    return endpoints;
}

std::vector<rotation::KeyDirectory> read_rotation(yyjson_val *root)
{
    auto *array = yyjson_obj_get(root, "rotation");
    if (array == nullptr || !yyjson_is_arr(array))
    {
        throw ConfigurationError("'rotation' must be an array of "
                                 "{\"key\", \"directory\"} entries");
    }
    std::vector<rotation::KeyDirectory> entries;
    std::size_t index = 0;
    std::size_t count = 0;
    yyjson_val *item = nullptr;
    yyjson_arr_foreach(array, index, count, item)
    {
        auto key = tf::json::string_member(item, "key");
        auto directory = tf::json::string_member(item, "directory");
        if (!key || key->empty() || !directory)
        {
            throw ConfigurationError(std::format(
                "rotation entry #{} needs 'key' and 'directory'", index));
        }
        entries.emplace_back(std::move(*key), std::move(*directory));
    }
    if (entries.empty())
    {
        throw ConfigurationError("'rotation' must contain at least one entry");
    }
    return entries;
}

PipelineSettings settings_from_document(tf::json::Document const &doc,
                                        std::filesystem::path const &base_dir);

} // namespace

std::string_view to_string(TransferMode mode) noexcept
{
    switch (mode)
    {
    case TransferMode::Synchronize:
        return "synchronize";
    case TransferMode::Stream:
        return "stream";
    }
    return "unknown";
}

PipelineSettings parse_pipeline_settings(std::string_view payload,
                                         std::filesystem::path const &base_dir)
{
    std::string error;
    auto doc = tf::json::Document::parse(payload, &error);
    if (!doc.is_valid())
    {
        throw ConfigurationError("invalid pipeline JSON: " + error);
    }
    return settings_from_document(doc, base_dir);
}

PipelineSettings load_pipeline_settings(std::filesystem::path const &path)
{
    std::string error;
    auto doc = tf::json::Document::read_file(path, &error);
    if (!doc.is_valid())
    {
        throw ConfigurationError(
            std::format("cannot read {}: {}", path.string(), error));
    }
    return settings_from_document(doc, path.parent_path());
}

namespace
{

PipelineSettings settings_from_document(tf::json::Document const &doc,
                                        std::filesystem::path const &base_dir)
{
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        throw ConfigurationError("pipeline configuration must be an object");
    }

    PipelineSettings settings;
    settings.fair = read_flag(root, "fair", settings.fair);
    settings.delete_remote_files =
        read_flag(root, "deleteRemoteFiles", settings.delete_remote_files);

    if (tf::json::has_member(root, "mode"))
    {
        auto mode = tf::json::string_member(root, "mode");
        if (mode && *mode == "synchronize")
        {
            settings.mode = TransferMode::Synchronize;
        }
        else if (mode && *mode == "stream")
        {
            settings.mode = TransferMode::Stream;
        }
        else
        {
            throw ConfigurationError(
                "'mode' must be \"synchronize\" or \"stream\"");
        }
    }

    if (tf::json::has_member(root, "pollIntervalMs"))
    {
        auto interval = tf::json::int_member(root, "pollIntervalMs");
        if (!interval || *interval <= 0)
        {
            throw ConfigurationError("'pollIntervalMs' must be positive");
        }
        settings.poll_interval = std::chrono::milliseconds(*interval);
    }
    settings.max_messages_per_poll =
        read_count(root, "maxMessagesPerPoll", settings.max_messages_per_poll);
    if (settings.max_messages_per_poll == 0)
    {
        throw ConfigurationError("'maxMessagesPerPoll' must be at least 1");
    }
    settings.max_fetch_size =
        read_count(root, "maxFetchSize", settings.max_fetch_size);

    if (auto local = tf::json::string_member(root, "localDirectory"))
    {
        settings.local_directory = resolve_against(base_dir, *local);
    }
    else if (tf::json::has_member(root, "localDirectory"))
    {
        throw ConfigurationError("'localDirectory' must be a string");
    }
    else
    {
        settings.local_directory = tf::utils::data_root() / "inbound";
    }

    settings.endpoints = read_endpoints(root, base_dir);
    settings.rotation = read_rotation(root);

    std::unordered_set<std::string> declared;
    for (auto const &endpoint : settings.endpoints)
    {
        declared.insert(endpoint.key);
    }
    if (auto fallback = tf::json::string_member(root, "defaultEndpoint"))
    {
        if (declared.count(*fallback) == 0)
        {
            throw ConfigurationError(std::format(
                "defaultEndpoint '{}' is not a declared endpoint", *fallback));
        }
        settings.default_endpoint = std::move(*fallback);
    }
    if (!settings.default_endpoint)
    {
        for (auto const &entry : settings.rotation)
        {
            if (declared.count(entry.key()) == 0)
            {
                throw ConfigurationError(std::format(
                    "rotation entry refers to undeclared endpoint '{}'",
                    entry.key()));
            }
        }
    }
    return settings;
}

} // namespace

} // namespace tf::engine
