#pragma once

#include <filesystem>
#include <optional>

namespace tf::utils
{

// Directory holding tinyfetch.log and the default local inbound directory.
// Resolution order: $TF_DATA_DIR, $XDG_STATE_HOME/tinyfetch,
// $HOME/.local/state/tinyfetch, <executable dir>/data.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();

// Creates the directory if needed; nullopt when it cannot be created.
std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate);

} // namespace tf::utils
