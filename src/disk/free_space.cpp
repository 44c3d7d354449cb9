#include <cerrno>
#include <cstring>
#include <sys/statvfs.h>

#include "disk/free_space.hpp"
#include "util/log.hpp"

namespace disk
{

std::optional<Usage> usage_of(const std::filesystem::path &dir)
{
    struct statvfs sv{};
    if (::statvfs(dir.c_str(), &sv) != 0)
    {
        LOG_WARN("statvfs failed for %s: %s", dir.c_str(), std::strerror(errno));
        return std::nullopt;
    }
    // same basis as df: used = blocks - bfree, usable = used + bavail
    const std::uint64_t used   = static_cast<std::uint64_t>(sv.f_blocks - sv.f_bfree);
    const std::uint64_t usable = used + static_cast<std::uint64_t>(sv.f_bavail);

    Usage u;
    u.available_bytes = static_cast<std::uint64_t>(sv.f_bavail) * sv.f_frsize;
    u.free_percent    = usable ? 100.0 * static_cast<double>(sv.f_bavail) / static_cast<double>(usable)
                               : 100.0;
    return u;
}

bool check_free_space(const std::filesystem::path &dir,
                      std::uint64_t                bytes_needed,
                      int                          min_free_percent)
{
    auto u = usage_of(dir);
    if (!u)
    {
        LOG_WARN("Unable to check free space on %s, continuing", dir.c_str());
        return true;
    }
    if (u->free_percent < static_cast<double>(min_free_percent))
    {
        LOG_ERROR("Not enough space on %s: %.1f%% free, need %d%%", dir.c_str(), u->free_percent,
                  min_free_percent);
        return false;
    }
    if (u->available_bytes < bytes_needed)
    {
        LOG_ERROR("Not enough space on %s: need=%llu avail=%llu", dir.c_str(),
                  (unsigned long long)bytes_needed, (unsigned long long)u->available_bytes);
        return false;
    }
    LOG_DEBUG("%s has %.1f%% free (%llu bytes)", dir.c_str(), u->free_percent,
              (unsigned long long)u->available_bytes);
    return true;
}

}  // namespace disk
