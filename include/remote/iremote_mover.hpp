#pragma once
#include <filesystem>
#include <string>

namespace remote
{

struct CopyResult
{
    bool        ok{false};
    std::string diagnostics;  // tool output on failure
};

// Opaque, already-authenticated copy/delete against the remote store.
// Remote paths are logical, '/'-separated and relative to the remote root.
struct IRemoteMover
{
    virtual CopyResult  copy(const std::filesystem::path &local_path,
                             const std::string           &remote_dir) = 0;
    virtual bool        delete_remote(const std::string &remote_path) = 0;
    virtual std::string name() const { return ""; }
    virtual ~IRemoteMover() = default;
};

}  // namespace remote
