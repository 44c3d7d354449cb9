#include <system_error>

#include "remote/mirror_mover.hpp"
#include "util/log.hpp"

namespace remote
{
namespace fs = std::filesystem;

MirrorMover::MirrorMover(fs::path root) : root_(std::move(root)) {}

fs::path MirrorMover::local_for(const std::string &remote_path) const
{
    fs::path p = root_;
    if (remote_path.empty())
        return p;
    const fs::path rel = fs::path(remote_path).lexically_normal().relative_path();
    for (const auto &part : rel)
    {
        if (part == "..")
            return fs::path();
    }
    p /= rel;
    return p;
}

CopyResult MirrorMover::copy(const fs::path &local_path, const std::string &remote_dir)
{
    CopyResult      res;
    std::error_code ec;
    const fs::path  dir = local_for(remote_dir);
    if (dir.empty())
    {
        res.diagnostics = "remote path escapes the mirror: " + remote_dir;
        return res;
    }
    fs::create_directories(dir, ec);
    if (ec)
    {
        res.diagnostics = "create_directories(" + dir.string() + "): " + ec.message();
        return res;
    }
    const fs::path dst = dir / local_path.filename();
    fs::copy_file(local_path, dst, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        res.diagnostics = "copy_file(" + local_path.string() + "): " + ec.message();
        return res;
    }
    res.ok = true;
    return res;
}

bool MirrorMover::delete_remote(const std::string &remote_path)
{
    std::error_code ec;
    const fs::path  p = local_for(remote_path);
    if (p.empty())
    {
        LOG_WARN("mirror: remote path escapes the mirror: %s", remote_path.c_str());
        return false;
    }
    if (!fs::remove(p, ec))
    {
        LOG_DEBUG("mirror: cannot remove %s: %s", p.c_str(),
                  ec ? ec.message().c_str() : "not found");
        return false;
    }
    return true;
}

}  // namespace remote
