#pragma once

#include <functional>
#include <string>

namespace tf::remote
{
class MessageSource;
}

namespace tf::rotation
{

// Applies the selected remote directory to a source.
using RotationCallback =
    std::function<void(std::string const &directory,
                       remote::MessageSource &source)>;

// Standard callback: routes the directory to the synchronizer of a
// synchronizing source or to a streaming source. Throws ConfigurationError
// for any other source.
void apply_remote_directory(std::string const &directory,
                            remote::MessageSource &source);

} // namespace tf::rotation
