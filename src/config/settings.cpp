#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>

#include "config/settings.hpp"
#include "remote/mirror_mover.hpp"
#include "remote/rclone_mover.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

Settings defaults()
{
    Settings s;
    s.chunk_size = constants::DEFAULT_CHUNK_SIZE;
    s.sidecar    = std::string(constants::SIDECAR_DIR);
    for (auto ext : constants::DEFAULT_SKIP_EXT)
        s.skip_extensions.emplace_back(ext);
    s.mover            = std::string(constants::DEFAULT_MOVER);
    s.rclone_program   = std::string(constants::DEFAULT_RCLONE);
    s.remote_service   = std::string(constants::DEFAULT_SERVICE);
    s.min_free_percent = constants::DEFAULT_MIN_FREE_PERCENT;
    s.log_level        = "info";
    return s;
}

std::optional<std::uint64_t> parse_size(const std::string &text)
{
    // strtoull skips blanks and wraps a negative value
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
        ++i;
    if (i == text.size() || text[i] == '-')
        return std::nullopt;
    const char        *start = text.c_str() + i;
    char              *end   = nullptr;
    errno                    = 0;
    unsigned long long v     = std::strtoull(start, &end, 10);
    if (errno != 0 || end == start)
        return std::nullopt;

    std::uint64_t mult = 1;
    std::string   rest(end);
    if (rest == "K" || rest == "k")
        mult = 1000ULL;
    else if (rest == "M" || rest == "m")
        mult = 1000ULL * 1000ULL;
    else if (rest == "G" || rest == "g")
        mult = 1000ULL * 1000ULL * 1000ULL;
    else if (!rest.empty())
        return std::nullopt;

    if (v > UINT64_MAX / mult)
        return std::nullopt;
    return static_cast<std::uint64_t>(v) * mult;
}

static std::optional<int> parse_int(const char *text, int lo, int hi)
{
    if (!text || !*text)
        return std::nullopt;
    char *end = nullptr;
    errno     = 0;
    long v    = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || v < lo || v > hi)
        return std::nullopt;
    return static_cast<int>(v);
}

std::vector<std::string> split_list(const std::string &text)
{
    std::vector<std::string> out;
    std::string              cur;
    for (char c : text)
    {
        if (c == ',' || c == ' ')
        {
            if (!cur.empty())
                out.push_back(cur);
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(cur);
    return out;
}

// Shared by env and flag parsing; `key` is the flag name without dashes.
static std::optional<std::string> set_value(Settings &s, const std::string &key, const char *v)
{
    if (key == "root")
        s.root = v;
    else if (key == "chunk-size")
    {
        auto n = parse_size(v);
        if (!n || *n == 0)
            return std::string("invalid chunk size '") + v + "' (must be > 0)";
        s.chunk_size = *n;
    }
    else if (key == "sidecar")
    {
        if (!*v)
            return std::string("sidecar directory name must not be empty");
        s.sidecar = v;
    }
    else if (key == "skip-ext")
        s.skip_extensions = split_list(v);
    else if (key == "mover")
        s.mover = v;
    else if (key == "rclone")
        s.rclone_program = v;
    else if (key == "remote")
        s.remote_service = v;
    else if (key == "dest")
        s.remote_dest = v;
    else if (key == "mirror")
        s.mirror_root = v;
    else if (key == "finish-hour")
    {
        auto h = parse_int(v, 0, 23);
        if (!h)
            return std::string("invalid finish hour '") + v + "' (expect 0..23)";
        s.finish_hour = *h;
    }
    else if (key == "min-free")
    {
        auto p = parse_int(v, 0, 100);
        if (!p)
            return std::string("invalid minimum free percent '") + v + "' (expect 0..100)";
        s.min_free_percent = *p;
    }
    else if (key == "log-level")
        s.log_level = v;
    else if (key == "log-file")
        s.log_file = v;
    else
        return "unknown option --" + key;
    return std::nullopt;
}

std::optional<std::string> apply_env(Settings &s)
{
    static const std::pair<const char *, const char *> vars[] = {
        {"CHUNKSYNC_ROOT", "root"},         {"CHUNKSYNC_CHUNK_SIZE", "chunk-size"},
        {"CHUNKSYNC_SIDECAR", "sidecar"},   {"CHUNKSYNC_SKIP_EXT", "skip-ext"},
        {"CHUNKSYNC_MOVER", "mover"},       {"CHUNKSYNC_RCLONE", "rclone"},
        {"CHUNKSYNC_REMOTE", "remote"},     {"CHUNKSYNC_DEST", "dest"},
        {"CHUNKSYNC_MIRROR", "mirror"},     {"CHUNKSYNC_FINISH_HOUR", "finish-hour"},
        {"CHUNKSYNC_MIN_FREE_PCT", "min-free"}, {"CHUNKSYNC_LOG_LEVEL", "log-level"},
        {"CHUNKSYNC_LOG_FILE", "log-file"},
    };
    for (const auto &[env, key] : vars)
    {
        const char *v = std::getenv(env);
        if (!v)
            continue;
        if (auto err = set_value(s, key, v))
            return std::string(env) + ": " + *err;
        LOG_DEBUG("Config: %s=%s", env, v);
    }
    return std::nullopt;
}

bool apply_flag(Settings &s, const std::string &flag, const char *value, int &consumed, std::string &err)
{
    consumed = 0;
    if (flag.rfind("--", 0) != 0)
    {
        err = "not an option: " + flag;
        return false;
    }
    if (!value)
    {
        err = "missing value after " + flag;
        return false;
    }
    if (auto e = set_value(s, flag.substr(2), value))
    {
        err = *e;
        return false;
    }
    consumed = 2;
    return true;
}

std::optional<std::string> validate(const Settings &s, bool need_root)
{
    if (s.chunk_size == 0)
        return std::string("chunk size must be > 0");
    if (s.mover != "rclone" && s.mover != "mirror")
        return "unknown mover '" + s.mover + "' (expect rclone|mirror)";
    if (s.mover == "mirror" && s.mirror_root.empty())
        return std::string("mirror mover needs --mirror <dir>");
    if (need_root)
    {
        std::error_code ec;
        if (s.root.empty())
            return std::string("tree root not set (--root or CHUNKSYNC_ROOT)");
        if (!std::filesystem::is_directory(s.root, ec))
            return "tree root " + s.root + " is not an existing directory";
    }
    return std::nullopt;
}

std::unique_ptr<remote::IRemoteMover> make_mover(const Settings &s)
{
    if (s.mover == "mirror")
        return std::make_unique<remote::MirrorMover>(s.mirror_root);

    remote::RcloneConfig cfg;
    cfg.program   = s.rclone_program;
    cfg.service   = s.remote_service;
    cfg.dest_root = s.remote_dest;
    return std::make_unique<remote::RcloneMover>(cfg);
}

}  // namespace config
