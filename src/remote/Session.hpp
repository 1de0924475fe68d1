#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tf::remote
{

struct RemoteFile
{
    std::string name;
    // Full remote path: directory + '/' + name.
    std::string path;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point modified;
};

// One connection to a remote endpoint. Failures are reported as nullopt/false
// and logged by the implementation; callers treat them as "nothing there".
class Session
{
  public:
    virtual ~Session() = default;

    virtual std::optional<std::vector<RemoteFile>>
    list(std::string const &directory) = 0;
    virtual std::optional<std::vector<std::uint8_t>>
    read(std::string const &path) = 0;
    virtual bool remove(std::string const &path) = 0;
};

class SessionFactory
{
  public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<Session> get_session() = 0;
};

std::string join_remote_path(std::string const &directory,
                             std::string const &name);

} // namespace tf::remote
