#include <algorithm>
#include <system_error>

#include "chunk/scanner.hpp"
#include "util/log.hpp"

namespace chunk
{
namespace fs = std::filesystem;

static ScanResult scan_failed(const fs::path &dir, const std::error_code &ec)
{
    ScanResult r;
    r.error = Error{ErrorKind::Scan, "cannot list " + dir.string() + ": " + ec.message()};
    LOG_ERROR("scan: %s", r.error.detail.c_str());
    return r;
}

ScanResult scan_chunks(std::string_view source_name, const fs::path &sidecar_dir)
{
    ScanResult      r;
    std::error_code ec;

    if (!fs::exists(sidecar_dir, ec))
    {
        if (ec)
            return scan_failed(sidecar_dir, ec);
        r.ok = true;
        return r;
    }

    fs::directory_iterator it(sidecar_dir, ec);
    if (ec)
        return scan_failed(sidecar_dir, ec);

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return scan_failed(sidecar_dir, ec);
        if (!it->is_regular_file(ec))
            continue;

        const std::string name   = it->path().filename().string();
        auto              parsed = parse_chunk_name(name, source_name);
        if (!parsed)
            continue;  // unrelated file

        Chunk c;
        c.ordinal = parsed->ordinal;
        c.style   = parsed->style;
        c.name    = name;
        c.path    = it->path();
        c.size    = it->file_size(ec);
        if (ec)
            return scan_failed(it->path(), ec);
        r.set.total_bytes += c.size;
        r.set.chunks.push_back(std::move(c));
    }
    if (ec)
        return scan_failed(sidecar_dir, ec);

    // directory order is arbitrary; the ordinal decides
    std::sort(r.set.chunks.begin(), r.set.chunks.end(), [](const Chunk &a, const Chunk &b) {
        if (a.ordinal != b.ordinal)
            return a.ordinal < b.ordinal;
        return a.name < b.name;
    });

    LOG_DEBUG("scan: %zu chunk(s) of %.*s in %s (%llu bytes)", r.set.count(),
              (int)source_name.size(), source_name.data(), sidecar_dir.string().c_str(),
              (unsigned long long)r.set.total_bytes);
    r.ok = true;
    return r;
}

}  // namespace chunk
