#include <algorithm>
#include <ctime>
#include <system_error>

#include "app/backup_run.hpp"
#include "remote/dest_path.hpp"
#include "util/log.hpp"

namespace app
{
namespace fs = std::filesystem;

static bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static int local_hour()
{
    std::time_t now = std::time(nullptr);
    std::tm     tm{};
    localtime_r(&now, &tm);
    return tm.tm_hour;
}

BackupRun::BackupRun(remote::IRemoteMover &mover, RunOptions opts)
    : mover_(mover), opts_(std::move(opts)), reconciler_(mover, opts_.reconciler)
{
    if (!opts_.hour_now)
        opts_.hour_now = local_hour;
}

bool BackupRun::is_skipped_file(const fs::path &file) const
{
    const std::string name = file.filename().string();
    for (const auto &ext : opts_.skip_extensions)
    {
        if (!ext.empty() && ends_with(name, ext))
            return true;
    }
    return false;
}

bool BackupRun::is_skipped_dir(const fs::path &dir) const
{
    const std::string name = dir.filename().string();
    // bundles are opaque packages, their contents are never backed up piecemeal
    return name == opts_.sidecar_name || ends_with(name, ".bundle");
}

bool BackupRun::should_stop(RunReport &report) const
{
    if (opts_.stop_flag && opts_.stop_flag->load())
    {
        LOG_SYSTEM("Stop requested, finishing after the current item");
        report.stopped_early = true;
        return true;
    }
    if (opts_.finish_hour && opts_.hour_now() >= *opts_.finish_hour)
    {
        LOG_SYSTEM("Reached finish hour %d, finishing gracefully", *opts_.finish_hour);
        report.stopped_early = true;
        return true;
    }
    return false;
}

void BackupRun::report_critical(const fs::path &item, const chunk::Error &err) const
{
    LOG_ERROR("");
    LOG_ERROR("======================================");
    LOG_ERROR("CRITICAL ERROR ENCOUNTERED - see below:");
    LOG_ERROR("======================================");
    LOG_ERROR("Last path and file processed: %s", item.c_str());
    LOG_ERROR("REASON: %s: %s", chunk::kind_name(err.kind), err.detail.c_str());
    LOG_ERROR("");
    LOG_ERROR("chunksync is terminating.");
}

bool BackupRun::walk(const fs::path &dir, RunReport &report)
{
    ++report.folders;

    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;
    std::error_code       ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        LOG_WARN("Cannot list %s: %s", dir.c_str(), ec.message().c_str());
        return true;
    }
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        if (it->is_symlink(ec))
            continue;
        if (it->is_directory(ec))
        {
            if (!is_skipped_dir(it->path()))
                subdirs.push_back(it->path());
        }
        else if (it->is_regular_file(ec))
        {
            files.push_back(it->path());
        }
    }
    if (ec)
        LOG_WARN("Listing %s stopped early: %s", dir.c_str(), ec.message().c_str());

    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());

    const std::string remote_dir = remote::resolve_dest_path(dir, opts_.root);
    const fs::path    sidecar    = dir / opts_.sidecar_name;

    for (const auto &file : files)
    {
        if (should_stop(report))
            return false;
        if (is_skipped_file(file))
        {
            LOG_INFO("Skipping %s (extension on the skip list)", file.c_str());
            continue;
        }

        ReconciliationContext ctx{SourceItem{file, 0}, opts_.spec, sidecar, remote_dir,
                                  report.counters};
        ItemOutcome           outcome = reconciler_.process(ctx);
        if (outcome.fatal())
        {
            report.error       = outcome.error;
            report.failed_item = file;
            report_critical(file, outcome.error);
            return false;
        }
    }

    for (const auto &sub : subdirs)
    {
        if (!walk(sub, report))
            return false;
    }
    return true;
}

void BackupRun::summary(const RunReport &report) const
{
    const auto &c = report.counters;
    LOG_SYSTEM("No. of files checked/uploaded: %llu", (unsigned long long)c.files);
    LOG_SYSTEM("No. of file chunks uploaded: %llu", (unsigned long long)c.chunks_uploaded);
    LOG_SYSTEM("No. of folders checked: %llu", (unsigned long long)report.folders);
    LOG_SYSTEM("Total size of files checked: %llu MB",
               (unsigned long long)((c.bytes_seen + 999999) / 1000000));
    LOG_SYSTEM("Chunk sets re-created: %llu, remote delete failures: %llu, transfer failures: %llu",
               (unsigned long long)c.resplits, (unsigned long long)c.remote_delete_failures,
               (unsigned long long)c.transfer_failures);
    if (report.errors_logged)
        LOG_SYSTEM("Errors were detected during this run (%u), see the log", report.errors_logged);
    else
        LOG_SYSTEM("No errors were encountered during this run");
}

RunReport BackupRun::run()
{
    RunReport      report;
    const unsigned errors_before = chunksync::error_count().load();

    std::error_code ec;
    if (!fs::is_directory(opts_.root, ec))
    {
        report.error = chunk::Error{chunk::ErrorKind::Plan, "tree root is not a directory: " +
                                                                 opts_.root.string()};
        LOG_ERROR("%s", report.error.detail.c_str());
        return report;
    }
    if (opts_.spec.chunk_size_bytes == 0)
    {
        report.error = chunk::Error{chunk::ErrorKind::Plan, "chunk size must be > 0"};
        LOG_ERROR("%s", report.error.detail.c_str());
        return report;
    }

    LOG_SYSTEM("chunksync: %s -> %s, chunk size %llu bytes", opts_.root.c_str(),
               mover_.name().c_str(), (unsigned long long)opts_.spec.chunk_size_bytes);

    report.completed = walk(opts_.root, report);

    report.errors_logged = chunksync::error_count().load() - errors_before;
    summary(report);
    return report;
}

}  // namespace app
