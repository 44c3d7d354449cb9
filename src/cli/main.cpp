#include <atomic>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <functional>
#include <unordered_map>
#include <vector>

#include "app/backup_run.hpp"
#include "app/reconciler.hpp"
#include "archive/zip_store.hpp"
#include "chunk/naming.hpp"
#include "chunk/plan.hpp"
#include "chunk/scanner.hpp"
#include "chunk/splitter.hpp"
#include "chunk/verifier.hpp"
#include "config/settings.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{
namespace fs = std::filesystem;

std::atomic<bool> g_stop{false};

static void on_signal(int)
{
    g_stop.store(true);
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunksync [options] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  run                                  back up the tree below --root\n"
                         "  plan <itemSize>                      show the chunk plan for a size\n"
                         "  verify <file>                        check the chunk set of a file\n"
                         "  split <file> <outDir>                chunk a file into outDir\n"
                         "  join <sidecarDir> <itemName> <out>   reassemble a chunk set\n"
                         "\n"
                         "Options:\n"
                         "  --root <dir>          tree root (CHUNKSYNC_ROOT)\n"
                         "  --chunk-size <n[KMG]> chunk size in bytes (CHUNKSYNC_CHUNK_SIZE)\n"
                         "  --sidecar <name>      per-directory chunk folder (CHUNKSYNC_SIDECAR)\n"
                         "  --skip-ext <a,b,...>  file suffixes never backed up (CHUNKSYNC_SKIP_EXT)\n"
                         "  --mover rclone|mirror remote mover (CHUNKSYNC_MOVER)\n"
                         "  --rclone <program>    rclone executable (CHUNKSYNC_RCLONE)\n"
                         "  --remote <service>    rclone remote name (CHUNKSYNC_REMOTE)\n"
                         "  --dest <path>         destination folder on the remote (CHUNKSYNC_DEST)\n"
                         "  --mirror <dir>        local mirror directory (CHUNKSYNC_MIRROR)\n"
                         "  --finish-hour <0-23>  stop between items at this hour (CHUNKSYNC_FINISH_HOUR)\n"
                         "  --min-free <pct>      minimum free space to chunk (CHUNKSYNC_MIN_FREE_PCT)\n"
                         "  --log-level <lvl>     debug|info|warn|error (CHUNKSYNC_LOG_LEVEL)\n"
                         "  --log-file <path>     append every message to a file (CHUNKSYNC_LOG_FILE)\n"
                         "  -h, --help\n");
}

static int cmd_run(const config::Settings &s)
{
    if (auto err = config::validate(s, true))
    {
        LOG_ERROR("Configuration: %s", err->c_str());
        return exitc::config;
    }
    auto mover = config::make_mover(s);

    app::RunOptions opts;
    opts.root                        = fs::absolute(s.root).lexically_normal();
    opts.spec                        = chunk::ChunkSpec{s.chunk_size};
    opts.sidecar_name                = s.sidecar;
    opts.skip_extensions             = s.skip_extensions;
    opts.finish_hour                 = s.finish_hour;
    opts.reconciler.min_free_percent = s.min_free_percent;
    opts.stop_flag                   = &g_stop;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    app::BackupRun run(*mover, opts);
    auto           report = run.run();
    return report.fatal() ? exitc::fatal : exitc::ok;
}

static int cmd_plan(const config::Settings &s, const std::string &size_text)
{
    auto size = config::parse_size(size_text);
    if (!size)
    {
        std::fprintf(stderr, "error: invalid item size: %s\n", size_text.c_str());
        return exitc::bad_args;
    }
    auto plan = chunk::make_plan(*size, s.chunk_size);
    if (!plan)
        return exitc::config;

    std::printf("item size:        %llu\n", (unsigned long long)plan->item_size);
    std::printf("chunk size:       %llu\n", (unsigned long long)s.chunk_size);
    std::printf("needs chunking:   %s\n",
                chunk::needs_chunking(*size, chunk::ChunkSpec{s.chunk_size}) ? "yes" : "no");
    std::printf("expected count:   %llu\n", (unsigned long long)plan->expected_count);
    std::printf("first chunk size: %llu\n", (unsigned long long)plan->expected_first_chunk_size);
    std::printf("chunk sizes:     ");
    for (auto n : chunk::chunk_sizes(*plan))
        std::printf(" %llu", (unsigned long long)n);
    std::printf("\n");
    return exitc::ok;
}

static int cmd_verify(const config::Settings &s, const fs::path &file)
{
    std::error_code ec;
    const auto      size = fs::file_size(file, ec);
    if (ec)
    {
        std::fprintf(stderr, "error: cannot stat %s: %s\n", file.c_str(), ec.message().c_str());
        return exitc::bad_args;
    }
    const std::string name    = file.filename().string();
    const fs::path    sidecar = file.parent_path() / s.sidecar;

    auto scan = chunk::scan_chunks(name, sidecar);
    if (!scan.ok)
    {
        LOG_ERROR("%s", scan.error.detail.c_str());
        return exitc::failed;
    }

    if (!chunk::needs_chunking(size, chunk::ChunkSpec{s.chunk_size}))
    {
        std::printf("%s: %llu bytes, transferred whole", name.c_str(), (unsigned long long)size);
        if (!scan.set.empty())
            std::printf(", %zu stale chunk(s) in %s", scan.set.count(), sidecar.c_str());
        std::printf("\n");
        return scan.set.empty() ? exitc::ok : exitc::failed;
    }

    const auto payload = app::Reconciler::payload_size(name, size);
    auto       plan    = chunk::make_plan(payload, s.chunk_size);
    if (!plan)
        return exitc::config;

    const auto verdict = chunk::verify(scan.set, *plan);
    std::printf("%s: %zu of %llu chunk(s), %llu of %llu bytes: %s\n", name.c_str(), scan.set.count(),
                (unsigned long long)plan->expected_count, (unsigned long long)scan.set.total_bytes,
                (unsigned long long)payload, chunk::describe(verdict).c_str());
    return verdict.valid() ? exitc::ok : exitc::failed;
}

static int cmd_split(const config::Settings &s, const fs::path &file, const fs::path &out_dir)
{
    std::error_code ec;
    if (!fs::is_regular_file(file, ec))
    {
        std::fprintf(stderr, "error: not a regular file: %s\n", file.c_str());
        return exitc::bad_args;
    }
    const std::string name  = file.filename().string();
    const auto        style = chunk::style_for(name);

    fs::create_directories(out_dir, ec);
    if (ec)
    {
        LOG_ERROR("Cannot create %s: %s", out_dir.c_str(), ec.message().c_str());
        return exitc::failed;
    }

    fs::path input = file;
    fs::path temp_archive;
    if (style == chunk::NameStyle::Archived)
    {
        temp_archive = out_dir / chunk::split_base(name, style);
        auto ar      = archive::write_stored_zip(file, temp_archive);
        if (!ar.ok)
        {
            LOG_ERROR("%s: %s", chunk::kind_name(ar.error.kind), ar.error.detail.c_str());
            return exitc::failed;
        }
        input = temp_archive;
    }

    auto sr = chunk::split_file(input, out_dir, name, style, s.chunk_size);
    if (!temp_archive.empty())
        fs::remove(temp_archive, ec);
    if (!sr.ok)
    {
        LOG_ERROR("%s: %s", chunk::kind_name(sr.error.kind), sr.error.detail.c_str());
        return exitc::failed;
    }
    for (const auto &c : sr.chunks)
        std::printf("%s %llu\n", c.name.c_str(), (unsigned long long)c.size);
    std::printf("blake2b %s\n", sr.digest_hex.c_str());
    return exitc::ok;
}

static int cmd_join(const fs::path &sidecar, const std::string &item, const fs::path &out_file)
{
    auto scan = chunk::scan_chunks(item, sidecar);
    if (!scan.ok)
    {
        LOG_ERROR("%s", scan.error.detail.c_str());
        return exitc::failed;
    }
    std::ofstream out(out_file, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        LOG_ERROR("Cannot open %s for writing", out_file.c_str());
        return exitc::failed;
    }
    auto rr = chunk::reassemble(scan.set, out);
    out.close();
    if (!rr.ok)
    {
        LOG_ERROR("%s: %s", chunk::kind_name(rr.error.kind), rr.error.detail.c_str());
        std::error_code ec;
        fs::remove(out_file, ec);
        return exitc::failed;
    }
    std::printf("%s %llu\n", out_file.c_str(), (unsigned long long)rr.bytes);
    std::printf("blake2b %s\n", rr.digest_hex.c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const config::Settings &s)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"run",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_run(s);
         }},
        {"plan",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_plan(s, args[1]);
         }},
        {"verify",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_verify(s, args[1]);
         }},
        {"split",
         [&]() -> int {
             if (args.size() != 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_split(s, args[1], args[2]);
         }},
        {"join",
         [&]() -> int {
             if (args.size() != 4)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_join(args[1], args[2], args[3]);
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // environment first, then command-line flags override it
    config::Settings settings = config::defaults();
    if (auto err = config::apply_env(settings))
    {
        std::fprintf(stderr, "error: %s\n", err->c_str());
        return exitc::config;
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a.rfind("--", 0) == 0)
        {
            int         used = 0;
            std::string err;
            if (!config::apply_flag(settings, a, i + 1 < argc ? argv[i + 1] : nullptr, used, err))
            {
                std::fprintf(stderr, "error: %s\n", err.c_str());
                return a == "--chunk-size" ? exitc::config : exitc::bad_args;
            }
            i += used - 1;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    chunksync::set_log_level_by_name(settings.log_level.c_str());
    if (!settings.log_file.empty() && !chunksync::open_log_file(settings.log_file))
    {
        std::fprintf(stderr, "error: cannot open log file %s\n", settings.log_file.c_str());
        return exitc::config;
    }

    int rc = run_cmd(args[0], args, settings);
    chunksync::close_log_file();
    return rc;
}
