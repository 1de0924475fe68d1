#pragma once

#include <stdexcept>
#include <string>

namespace tf
{

// Raised for wiring mistakes detected while assembling a pipeline: an empty
// rotation list, a missing collaborator, a source of the wrong shape or a
// malformed configuration file. Never retried.
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(std::string const &message)
        : std::invalid_argument(message)
    {
    }
};

} // namespace tf
