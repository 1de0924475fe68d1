#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tf::remote
{

class InboundFileSynchronizer;
class StreamingMessageSource;

struct Message
{
    std::string endpoint_key;
    std::string remote_directory;
    std::string file_name;
    // Set by synchronizing sources: where the file was copied to.
    std::filesystem::path local_file;
    // Set by streaming sources: the file content read from the endpoint.
    std::vector<std::uint8_t> content;
};

// The object that owns the "active remote directory" of a source. The set of
// shapes is closed; monostate marks a source that cannot be redirected.
using DirectoryTarget =
    std::variant<std::monostate, InboundFileSynchronizer *,
                 StreamingMessageSource *>;

class MessageSource
{
  public:
    virtual ~MessageSource() = default;

    // One receive attempt. nullopt means the poll produced nothing.
    virtual std::optional<Message> receive() = 0;

    virtual DirectoryTarget directory_target() { return std::monostate{}; }
};

} // namespace tf::remote
