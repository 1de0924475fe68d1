#pragma once

#include "remote/MessageSource.hpp"
#include "remote/Session.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tf::remote
{

class DelegatingSessionFactory;

// Reads remote files straight into messages without a local copy. A listing
// of the active remote directory is buffered and drained one file per
// receive. The buffer is dropped when the directory or the endpoint changes,
// so a message is always read from the endpoint it was listed on.
class StreamingMessageSource final : public MessageSource
{
  public:
    explicit StreamingMessageSource(DelegatingSessionFactory *factory);

    void set_remote_directory(std::string directory);
    std::string remote_directory() const;

    // 0 buffers the whole listing.
    void set_max_fetch_size(std::size_t max_fetch) noexcept;

    std::optional<Message> receive() override;
    DirectoryTarget directory_target() override;

  private:
    void refill(Session &session, std::string const &directory,
                std::string const &key);

    DelegatingSessionFactory *factory_;

    mutable std::mutex mutex_;
    std::string remote_directory_;
    std::size_t max_fetch_ = 0;
    std::deque<RemoteFile> buffered_;
    std::string buffered_key_;
    std::unordered_set<std::string> seen_;
};

} // namespace tf::remote
