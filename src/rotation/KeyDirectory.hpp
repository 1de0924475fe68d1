#pragma once

#include <string>
#include <utility>

namespace tf::rotation
{

// One stop in a rotation cycle: the endpoint to select and the remote
// directory to read from while it is selected.
class KeyDirectory
{
  public:
    KeyDirectory(std::string key, std::string directory)
        : key_(std::move(key)), directory_(std::move(directory))
    {
    }

    std::string const &key() const noexcept { return key_; }
    std::string const &directory() const noexcept { return directory_; }

    friend bool operator==(KeyDirectory const &,
                           KeyDirectory const &) = default;

  private:
    std::string key_;
    std::string directory_;
};

} // namespace tf::rotation
