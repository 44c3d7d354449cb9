#pragma once
#include <string>
#include <vector>

#include "remote/iremote_mover.hpp"

namespace remote
{

struct RcloneConfig
{
    std::string program = "rclone";  // resolved through PATH when not absolute
    std::string service = "box";     // remote name from `rclone config`
    std::string dest_root;           // folder on the remote that mirrors the tree root
};

class RcloneMover final : public IRemoteMover
{
  public:
    explicit RcloneMover(RcloneConfig cfg);

    CopyResult  copy(const std::filesystem::path &local_path, const std::string &remote_dir) override;
    bool        delete_remote(const std::string &remote_path) override;
    std::string name() const override { return "rclone"; }

    // "<service>:<dest_root/path>"
    std::string remote_spec(const std::string &path) const;

  private:
    RcloneConfig cfg_;
};

struct RunOutput
{
    int         exit_code{-1};  // 127 when the program could not be started
    std::string err;            // captured stderr
};

// Runs argv[0] with argv (no shell), stdout discarded, stderr captured.
RunOutput run_process(const std::vector<std::string> &argv);

}  // namespace remote
