#pragma once

#include "remote/MessageSource.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <unordered_set>

namespace tf::remote
{

class InboundFileSynchronizer;

// Emits one local file per receive. Files already present in the local
// directory are handed out first; only when none are pending does the source
// ask the synchronizer to fetch more from the active remote directory.
class SynchronizingMessageSource final : public MessageSource
{
  public:
    SynchronizingMessageSource(InboundFileSynchronizer *synchronizer,
                               std::filesystem::path local_directory);

    void set_max_fetch_size(std::size_t max_fetch) noexcept;

    std::optional<Message> receive() override;
    DirectoryTarget directory_target() override;

    InboundFileSynchronizer &synchronizer() const noexcept
    {
        return *synchronizer_;
    }
    std::filesystem::path const &local_directory() const noexcept
    {
        return local_directory_;
    }

  private:
    void scan_local_directory();
    std::optional<Message> next_pending();

    InboundFileSynchronizer *synchronizer_;
    std::filesystem::path local_directory_;
    std::size_t max_fetch_ = 0;

    std::mutex mutex_;
    std::deque<std::filesystem::path> pending_;
    std::unordered_set<std::string> seen_;
};

} // namespace tf::remote
