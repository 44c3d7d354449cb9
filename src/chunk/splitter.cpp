#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include "chunk/splitter.hpp"
#include "digest/blake2b.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace chunk
{
namespace fs = std::filesystem;

static constexpr std::uint32_t MAX_ORDINAL = 999999999u;

static SplitResult split_failed(std::vector<Chunk> &done, const fs::path &partial, std::string why)
{
    std::error_code ec;
    if (!partial.empty())
        fs::remove(partial, ec);
    remove_chunks(done);
    done.clear();

    SplitResult r;
    r.ok     = false;
    r.error  = Error{ErrorKind::Split, std::move(why)};
    LOG_ERROR("split: %s", r.error.detail.c_str());
    return r;
}

SplitResult split_file(const fs::path  &input,
                       const fs::path  &out_dir,
                       std::string_view source_name,
                       NameStyle        style,
                       std::uint64_t    chunk_size)
{
    std::vector<Chunk> produced;
    if (chunk_size == 0)
        return split_failed(produced, {}, "chunk size must be > 0");

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec)
        return split_failed(produced, {},
                            "cannot create " + out_dir.string() + ": " + ec.message());

    std::ifstream in(input, std::ios::binary);
    if (!in)
        return split_failed(produced, {},
                            "cannot open " + input.string() + ": " + std::strerror(errno));

    digest::Blake2b   hash;
    std::vector<char> buf(static_cast<std::size_t>(
        std::min<std::uint64_t>(constants::IO_BUFFER, chunk_size)));
    std::uint64_t     total   = 0;
    std::uint32_t     ordinal = 0;
    bool              at_end  = false;

    while (!at_end)
    {
        // the first chunk exists even for an empty input
        if (ordinal > 0 && in.peek() == std::char_traits<char>::eof())
        {
            if (in.bad())
                return split_failed(produced, {}, "read failed on " + input.string());
            break;
        }
        if (ordinal == MAX_ORDINAL)
            return split_failed(produced, {}, "too many chunks for " + input.string());
        ++ordinal;

        Chunk c;
        c.ordinal = ordinal;
        c.style   = style;
        c.name    = format_chunk_name(source_name, style, ordinal);
        c.path    = out_dir / c.name;
        fs::path partial = c.path;
        partial += std::string(constants::PARTIAL_SUFFIX);

        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out)
            return split_failed(produced, partial,
                                "cannot create " + partial.string() + ": " + std::strerror(errno));

        while (c.size < chunk_size)
        {
            const auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(buf.size(), chunk_size - c.size));
            in.read(buf.data(), static_cast<std::streamsize>(want));
            const auto got = static_cast<std::size_t>(in.gcount());
            if (got > 0)
            {
                out.write(buf.data(), static_cast<std::streamsize>(got));
                if (!out)
                    return split_failed(produced, partial, "write failed on " + partial.string());
                hash.update(buf.data(), got);
                c.size += got;
            }
            if (got < want)
            {
                if (in.bad())
                    return split_failed(produced, partial, "read failed on " + input.string());
                at_end = true;
                break;
            }
        }

        out.flush();
        out.close();
        if (!out)
            return split_failed(produced, partial, "write failed on " + partial.string());

        fs::rename(partial, c.path, ec);
        if (ec)
            return split_failed(produced, partial,
                                "cannot rename " + partial.string() + ": " + ec.message());

        total += c.size;
        LOG_DEBUG("split: wrote %s (%llu bytes)", c.name.c_str(), (unsigned long long)c.size);
        produced.push_back(std::move(c));
    }

    SplitResult r;
    r.ok         = true;
    r.chunks     = std::move(produced);
    r.bytes      = total;
    r.digest_hex = hash.hex_final();
    return r;
}

ReassembleResult reassemble(const ChunkSet &set, std::ostream &out)
{
    ReassembleResult r;
    if (set.empty() || !set.contiguous())
    {
        r.error = Error{ErrorKind::Split, "chunk set is empty or has gaps"};
        LOG_ERROR("reassemble: %s", r.error.detail.c_str());
        return r;
    }

    digest::Blake2b   hash;
    std::vector<char> buf(constants::IO_BUFFER);
    for (const auto &c : set.chunks)
    {
        std::ifstream in(c.path, std::ios::binary);
        if (!in)
        {
            r.error = Error{ErrorKind::Split, "cannot open " + c.path.string()};
            LOG_ERROR("reassemble: %s", r.error.detail.c_str());
            return r;
        }
        while (in)
        {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto got = in.gcount();
            if (got <= 0)
                break;
            out.write(buf.data(), got);
            hash.update(buf.data(), static_cast<std::size_t>(got));
            r.bytes += static_cast<std::uint64_t>(got);
        }
        if (in.bad() || !out)
        {
            r.error = Error{ErrorKind::Split, "copy failed at " + c.name};
            LOG_ERROR("reassemble: %s", r.error.detail.c_str());
            return r;
        }
    }
    r.ok         = true;
    r.digest_hex = hash.hex_final();
    return r;
}

std::size_t remove_chunks(const std::vector<Chunk> &chunks)
{
    std::size_t failed = 0;
    for (const auto &c : chunks)
    {
        std::error_code ec;
        if (!fs::remove(c.path, ec) && ec)
        {
            LOG_WARN("remove_chunks: %s: %s", c.path.string().c_str(), ec.message().c_str());
            ++failed;
        }
    }
    return failed;
}

}  // namespace chunk
