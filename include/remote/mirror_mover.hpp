#pragma once
#include <filesystem>

#include "remote/iremote_mover.hpp"

namespace remote
{

// A local directory standing in for the remote store (dry runs and tests without rclone).
class MirrorMover final : public IRemoteMover
{
  public:
    explicit MirrorMover(std::filesystem::path root);

    CopyResult  copy(const std::filesystem::path &local_path, const std::string &remote_dir) override;
    bool        delete_remote(const std::string &remote_path) override;
    std::string name() const override { return "mirror"; }

    // Empty when the normalized path climbs above the mirror root.
    std::filesystem::path local_for(const std::string &remote_path) const;

  private:
    std::filesystem::path root_;
};

}  // namespace remote
