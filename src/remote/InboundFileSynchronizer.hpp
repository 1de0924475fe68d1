#pragma once

#include "remote/Session.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace tf::remote
{

class DelegatingSessionFactory;

// Copies files from the active remote directory of the currently selected
// endpoint into a local directory. Each (endpoint, remote path) is fetched at
// most once for the lifetime of the synchronizer. A local name already taken
// by another file gets the endpoint key as a prefix instead of being
// overwritten.
class InboundFileSynchronizer
{
  public:
    struct FileOrigin
    {
        std::string endpoint_key;
        std::string remote_directory;
        std::string file_name;
    };

    // Suffix of files still being copied; they are renamed once complete.
    static constexpr char const kPartialSuffix[] = ".part";

    explicit InboundFileSynchronizer(DelegatingSessionFactory *factory);

    void set_remote_directory(std::string directory);
    std::string remote_directory() const;

    void set_delete_remote_files(bool enabled);

    // Returns how many files were copied. max_fetch == 0 means no limit.
    std::size_t
    synchronize_to_local_directory(std::filesystem::path const &local_dir,
                                   std::size_t max_fetch = 0);

    // Where a file copied into the local directory came from.
    std::optional<FileOrigin>
    origin_of(std::filesystem::path const &local_file) const;
    // As origin_of, but forgets the file afterwards.
    std::optional<FileOrigin>
    take_origin(std::filesystem::path const &local_file);

  private:
    bool copy_one(Session &session, RemoteFile const &file,
                  std::filesystem::path const &local_dir,
                  FileOrigin const &origin);

    DelegatingSessionFactory *factory_;

    mutable std::mutex mutex_;
    std::string remote_directory_;
    bool delete_remote_files_ = false;
    std::unordered_set<std::string> fetched_;
    std::unordered_map<std::string, FileOrigin> origins_;
};

} // namespace tf::remote
