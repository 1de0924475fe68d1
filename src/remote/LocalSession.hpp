#pragma once

#include "remote/Session.hpp"

#include <filesystem>

namespace tf::remote
{

// Endpoint backed by a local directory tree (a mounted share or a test
// fixture). Remote paths are resolved below the root; ".." segments that
// would escape it are rejected.
class LocalSession final : public Session
{
  public:
    explicit LocalSession(std::filesystem::path root);

    std::optional<std::vector<RemoteFile>>
    list(std::string const &directory) override;
    std::optional<std::vector<std::uint8_t>>
    read(std::string const &path) override;
    bool remove(std::string const &path) override;

  private:
    std::optional<std::filesystem::path> resolve(std::string const &path) const;

    std::filesystem::path root_;
};

class LocalSessionFactory final : public SessionFactory
{
  public:
    explicit LocalSessionFactory(std::filesystem::path root);

    std::unique_ptr<Session> get_session() override;

    std::filesystem::path const &root() const noexcept { return root_; }

  private:
    std::filesystem::path root_;
};

} // namespace tf::remote
