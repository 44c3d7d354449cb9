#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "app/reconciler.hpp"
#include "chunk/errors.hpp"
#include "chunk/plan.hpp"
#include "remote/iremote_mover.hpp"

namespace app
{

struct RunOptions
{
    std::filesystem::path    root;
    chunk::ChunkSpec         spec;
    std::string              sidecar_name = ".rclone";
    std::vector<std::string> skip_extensions;
    std::optional<int>       finish_hour;  // stop between items once this local hour is reached
    ReconcilerOptions        reconciler;
    const std::atomic<bool> *stop_flag = nullptr;  // set from a signal handler
    std::function<int()>     hour_now;             // defaults to the local wall clock
};

struct RunReport
{
    bool                  completed{false};  // whole tree walked
    bool                  stopped_early{false};
    RunCounters           counters;
    std::uint64_t         folders{0};
    chunk::Error          error;  // fatal error that stopped the run
    std::filesystem::path failed_item;
    unsigned              errors_logged{0};

    bool fatal() const { return chunk::is_fatal(error.kind); }
};

// Walks the tree one item at a time, reconciling and transferring each before the next.
class BackupRun
{
  public:
    BackupRun(remote::IRemoteMover &mover, RunOptions opts);

    RunReport run();

    bool is_skipped_file(const std::filesystem::path &file) const;
    bool is_skipped_dir(const std::filesystem::path &dir) const;

  private:
    // false once the run must stop (fatal outcome or stop request)
    bool walk(const std::filesystem::path &dir, RunReport &report);
    bool should_stop(RunReport &report) const;
    void report_critical(const std::filesystem::path &item, const chunk::Error &err) const;
    void summary(const RunReport &report) const;

    remote::IRemoteMover &mover_;
    RunOptions            opts_;
    Reconciler            reconciler_;
};

}  // namespace app
