#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "remote/dest_path.hpp"
#include "remote/rclone_mover.hpp"
#include "util/log.hpp"

namespace remote
{

RunOutput run_process(const std::vector<std::string> &argv)
{
    RunOutput out;
    if (argv.empty())
        return out;

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &s : argv)
        args.push_back(const_cast<char *>(s.c_str()));
    args.push_back(nullptr);

    int err_pipe[2];
    if (::pipe(err_pipe) != 0)
    {
        LOG_ERROR("pipe() failed: %s", std::strerror(errno));
        return out;
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        LOG_ERROR("fork() failed: %s", std::strerror(errno));
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return out;
    }
    if (pid == 0)
    {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ::close(err_pipe[1]);
    char buf[4096];
    for (;;)
    {
        ssize_t n = ::read(err_pipe[0], buf, sizeof(buf));
        if (n > 0)
        {
            out.err.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    ::close(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            LOG_ERROR("waitpid() failed: %s", std::strerror(errno));
            return out;
        }
    }
    out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return out;
}

RcloneMover::RcloneMover(RcloneConfig cfg) : cfg_(std::move(cfg)) {}

std::string RcloneMover::remote_spec(const std::string &path) const
{
    return cfg_.service + ":" + join_remote(cfg_.dest_root, path);
}

CopyResult RcloneMover::copy(const std::filesystem::path &local_path, const std::string &remote_dir)
{
    const std::string dst = remote_spec(remote_dir);
    LOG_DEBUG("rclone copy %s %s", local_path.c_str(), dst.c_str());

    RunOutput  r = run_process({cfg_.program, "copy", "-vv", local_path.string(), dst});
    CopyResult res;
    res.ok = (r.exit_code == 0);
    if (!res.ok)
        res.diagnostics = r.exit_code == 127 && r.err.empty()
                              ? "cannot run " + cfg_.program
                              : r.err;
    return res;
}

bool RcloneMover::delete_remote(const std::string &remote_path)
{
    const std::string dst = remote_spec(remote_path);
    LOG_DEBUG("rclone deletefile %s", dst.c_str());

    RunOutput r = run_process({cfg_.program, "deletefile", dst});
    if (r.exit_code != 0)
    {
        LOG_DEBUG("rclone deletefile exit=%d: %s", r.exit_code, r.err.c_str());
        return false;
    }
    return true;
}

}  // namespace remote
