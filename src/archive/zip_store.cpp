#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <vector>
#include <zlib.h>

#include "archive/zip_store.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace archive
{
namespace fs = std::filesystem;

static constexpr std::uint32_t SIG_LOCAL       = 0x04034B50;
static constexpr std::uint32_t SIG_CENTRAL     = 0x02014B50;
static constexpr std::uint32_t SIG_EOCD        = 0x06054B50;
static constexpr std::uint32_t SIG_ZIP64_EOCD  = 0x06064B50;
static constexpr std::uint32_t SIG_ZIP64_LOCAT = 0x07064B50;

static constexpr std::uint16_t FLAG_UTF8      = 1 << 11;
static constexpr std::uint16_t VER_PLAIN      = 20;
static constexpr std::uint16_t VER_ZIP64      = 45;
static constexpr std::uint16_t MADE_BY_UNIX   = 3 << 8;
static constexpr std::uint16_t ZIP64_EXTRA_ID = 0x0001;

static constexpr std::uint64_t LOCAL_FIXED   = 30;
static constexpr std::uint64_t CENTRAL_FIXED = 46;
static constexpr std::uint64_t EOCD_FIXED    = 22;
static constexpr std::uint64_t ZIP64_EXTRA   = 20;  // id + len + 2 x uint64 sizes
static constexpr std::uint64_t ZIP64_TAIL    = 56 + 20;

static constexpr std::uint64_t U32_MAX = 0xFFFFFFFFull;

namespace
{

// little-endian field writer
struct Le
{
    std::vector<std::uint8_t> b;

    void u16(std::uint16_t v)
    {
        b.push_back(static_cast<std::uint8_t>(v & 0xFF));
        b.push_back(static_cast<std::uint8_t>(v >> 8));
    }
    void u32(std::uint32_t v)
    {
        for (int i = 0; i < 4; ++i)
            b.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void u64(std::uint64_t v)
    {
        for (int i = 0; i < 8; ++i)
            b.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void str(std::string_view s) { b.insert(b.end(), s.begin(), s.end()); }
};

struct DosStamp
{
    std::uint16_t time{0};
    std::uint16_t date{0};
};

DosStamp dos_stamp(std::time_t t)
{
    std::tm tm{};
    localtime_r(&t, &tm);
    DosStamp d;
    if (tm.tm_year < 80)
        return DosStamp{0, (1 << 5) | 1};  // 1980-01-01, earliest DOS date
    d.time = static_cast<std::uint16_t>(((tm.tm_hour & 31) << 11) | ((tm.tm_min & 63) << 5) |
                                        ((tm.tm_sec / 2) & 31));
    d.date = static_cast<std::uint16_t>((((tm.tm_year - 80) & 127) << 9) |
                                        (((tm.tm_mon + 1) & 15) << 5) | (tm.tm_mday & 31));
    return d;
}

struct Entry
{
    std::string   name;
    std::uint64_t size{0};
    std::uint32_t crc{0};
    std::uint32_t mode{0};
    DosStamp      stamp;
    bool          zip64{false};
};

Le local_header(const Entry &e)
{
    Le h;
    h.u32(SIG_LOCAL);
    h.u16(e.zip64 ? VER_ZIP64 : VER_PLAIN);
    h.u16(FLAG_UTF8);
    h.u16(0);  // stored
    h.u16(e.stamp.time);
    h.u16(e.stamp.date);
    h.u32(e.crc);
    h.u32(e.zip64 ? static_cast<std::uint32_t>(U32_MAX) : static_cast<std::uint32_t>(e.size));
    h.u32(e.zip64 ? static_cast<std::uint32_t>(U32_MAX) : static_cast<std::uint32_t>(e.size));
    h.u16(static_cast<std::uint16_t>(e.name.size()));
    h.u16(e.zip64 ? static_cast<std::uint16_t>(ZIP64_EXTRA) : 0);
    h.str(e.name);
    if (e.zip64)
    {
        h.u16(ZIP64_EXTRA_ID);
        h.u16(16);
        h.u64(e.size);
        h.u64(e.size);
    }
    return h;
}

Le central_tail(const Entry &e, std::uint64_t cd_offset)
{
    Le h;
    h.u32(SIG_CENTRAL);
    h.u16(MADE_BY_UNIX | (e.zip64 ? VER_ZIP64 : VER_PLAIN));
    h.u16(e.zip64 ? VER_ZIP64 : VER_PLAIN);
    h.u16(FLAG_UTF8);
    h.u16(0);
    h.u16(e.stamp.time);
    h.u16(e.stamp.date);
    h.u32(e.crc);
    h.u32(e.zip64 ? static_cast<std::uint32_t>(U32_MAX) : static_cast<std::uint32_t>(e.size));
    h.u32(e.zip64 ? static_cast<std::uint32_t>(U32_MAX) : static_cast<std::uint32_t>(e.size));
    h.u16(static_cast<std::uint16_t>(e.name.size()));
    h.u16(e.zip64 ? static_cast<std::uint16_t>(ZIP64_EXTRA) : 0);
    h.u16(0);  // comment
    h.u16(0);  // disk
    h.u16(0);  // internal attrs
    h.u32(e.mode << 16);
    h.u32(0);  // local header offset
    h.str(e.name);
    if (e.zip64)
    {
        h.u16(ZIP64_EXTRA_ID);
        h.u16(16);
        h.u64(e.size);
        h.u64(e.size);
    }

    const std::uint64_t cd_size = CENTRAL_FIXED + e.name.size() + (e.zip64 ? ZIP64_EXTRA : 0);
    if (e.zip64)
    {
        const std::uint64_t z64_eocd_offset = cd_offset + cd_size;
        h.u32(SIG_ZIP64_EOCD);
        h.u64(56 - 12);  // record size excluding signature and this field
        h.u16(MADE_BY_UNIX | VER_ZIP64);
        h.u16(VER_ZIP64);
        h.u32(0);
        h.u32(0);
        h.u64(1);
        h.u64(1);
        h.u64(cd_size);
        h.u64(cd_offset);

        h.u32(SIG_ZIP64_LOCAT);
        h.u32(0);
        h.u64(z64_eocd_offset);
        h.u32(1);
    }

    h.u32(SIG_EOCD);
    h.u16(0);
    h.u16(0);
    h.u16(1);
    h.u16(1);
    h.u32(static_cast<std::uint32_t>(cd_size));
    h.u32(e.zip64 ? static_cast<std::uint32_t>(U32_MAX) : static_cast<std::uint32_t>(cd_offset));
    h.u16(0);
    return h;
}

bool put(std::ofstream &out, const Le &h)
{
    out.write(reinterpret_cast<const char *>(h.b.data()), static_cast<std::streamsize>(h.b.size()));
    return static_cast<bool>(out);
}

}  // namespace

bool needs_zip64(std::size_t name_len, std::uint64_t payload_size)
{
    return LOCAL_FIXED + name_len + payload_size >= U32_MAX;
}

std::uint64_t stored_zip_size(std::string_view entry_name, std::uint64_t payload_size)
{
    const bool z64 = needs_zip64(entry_name.size(), payload_size);
    return payload_size + LOCAL_FIXED + CENTRAL_FIXED + EOCD_FIXED + 2 * entry_name.size() +
           (z64 ? 2 * ZIP64_EXTRA + ZIP64_TAIL : 0);
}

static ArchiveResult archive_failed(const fs::path &zip_path, std::string why)
{
    std::error_code ec;
    fs::remove(zip_path, ec);
    ArchiveResult r;
    r.error = chunk::Error{chunk::ErrorKind::Archive, std::move(why)};
    LOG_ERROR("archive: %s", r.error.detail.c_str());
    return r;
}

ArchiveResult write_stored_zip(const fs::path &source, const fs::path &zip_path)
{
    struct stat st{};
    if (::stat(source.c_str(), &st) != 0)
        return archive_failed(zip_path,
                              "cannot stat " + source.string() + ": " + std::strerror(errno));

    Entry e;
    e.name  = source.filename().string();
    e.size  = static_cast<std::uint64_t>(st.st_size);
    e.mode  = static_cast<std::uint32_t>(st.st_mode);
    e.stamp = dos_stamp(st.st_mtime);
    e.zip64 = needs_zip64(e.name.size(), e.size);
    if (e.name.size() > 0xFFFF)
        return archive_failed(zip_path, "entry name too long: " + e.name);

    std::ifstream in(source, std::ios::binary);
    if (!in)
        return archive_failed(zip_path,
                              "cannot open " + source.string() + ": " + std::strerror(errno));
    std::ofstream out(zip_path, std::ios::binary | std::ios::trunc);
    if (!out)
        return archive_failed(zip_path,
                              "cannot create " + zip_path.string() + ": " + std::strerror(errno));

    // header goes out with crc 0 and is patched once the payload has been streamed
    const Le header = local_header(e);
    if (!put(out, header))
        return archive_failed(zip_path, "write failed on " + zip_path.string());

    uLong             crc    = crc32(0L, Z_NULL, 0);
    std::uint64_t     copied = 0;
    std::vector<char> buf(constants::IO_BUFFER);
    while (in)
    {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0)
            break;
        crc = crc32(crc, reinterpret_cast<const Bytef *>(buf.data()), static_cast<uInt>(got));
        out.write(buf.data(), got);
        if (!out)
            return archive_failed(zip_path, "write failed on " + zip_path.string());
        copied += static_cast<std::uint64_t>(got);
    }
    if (in.bad())
        return archive_failed(zip_path, "read failed on " + source.string());
    if (copied != e.size)
        return archive_failed(zip_path, source.string() + " changed size while archiving");

    e.crc = static_cast<std::uint32_t>(crc);
    const std::uint64_t cd_offset = header.b.size() + copied;
    if (!put(out, central_tail(e, cd_offset)))
        return archive_failed(zip_path, "write failed on " + zip_path.string());

    out.seekp(14);  // crc-32 field of the local header
    Le patch;
    patch.u32(e.crc);
    if (!put(out, patch))
        return archive_failed(zip_path, "cannot patch header of " + zip_path.string());

    out.close();
    if (!out)
        return archive_failed(zip_path, "write failed on " + zip_path.string());

    ArchiveResult r;
    r.ok    = true;
    r.bytes = stored_zip_size(e.name, e.size);
    LOG_DEBUG("archive: %s -> %s (%llu bytes, crc %08x)", source.string().c_str(),
              zip_path.string().c_str(), (unsigned long long)r.bytes, e.crc);
    return r;
}

}  // namespace archive
