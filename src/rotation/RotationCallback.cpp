#include "rotation/RotationCallback.hpp"

#include "remote/InboundFileSynchronizer.hpp"
#include "remote/MessageSource.hpp"
#include "remote/StreamingMessageSource.hpp"
#include "utils/Error.hpp"

#include <type_traits>
#include <variant>

namespace tf::rotation
{

void apply_remote_directory(std::string const &directory,
                            remote::MessageSource &source)
{
    std::visit(
        [&directory](auto const &target)
        {
            using Target = std::decay_t<decltype(target)>;
            if constexpr (std::is_same_v<Target, std::monostate>)
            {
                throw ConfigurationError(
                    "source must be a synchronizing remote file source or a "
                    "streaming remote file source");
            }
            else
            {
                if (target == nullptr)
                {
                    throw ConfigurationError(
                        "source reported an empty remote directory target");
                }
                target->set_remote_directory(directory);
            }
        },
        source.directory_target());
}

} // namespace tf::rotation
