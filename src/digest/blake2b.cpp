#include <fstream>
#include <vector>

#include "digest/blake2b.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(DIGEST_SIZE == crypto_generichash_BYTES, "digest size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

Blake2b::Blake2b()
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("blake2b: sodium_init failed");
        return;
    }
    if (crypto_generichash_init(&state_, nullptr, 0, DIGEST_SIZE) != 0)
    {
        LOG_ERROR("blake2b: crypto_generichash_init failed");
        return;
    }
    ready_ = true;
}

void Blake2b::update(const void *data, std::size_t size)
{
    if (!ready_ || finished_ || size == 0)
        return;
    crypto_generichash_update(&state_, static_cast<const unsigned char *>(data), size);
}

std::string Blake2b::hex_final()
{
    if (!ready_ || finished_)
        return {};
    finished_ = true;

    unsigned char out[DIGEST_SIZE];
    if (crypto_generichash_final(&state_, out, sizeof(out)) != 0)
    {
        LOG_ERROR("blake2b: crypto_generichash_final failed");
        return {};
    }

    char hex[DIGEST_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), out, sizeof(out));
    return std::string(hex);
}

std::optional<std::string> file_hex(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("file_hex: cannot open %s", path.string().c_str());
        return std::nullopt;
    }
    Blake2b h;
    if (!h.ok())
        return std::nullopt;
    std::vector<char> buf(constants::IO_BUFFER);
    while (in)
    {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0)
            break;
        h.update(buf.data(), static_cast<std::size_t>(got));
    }
    if (in.bad())
    {
        LOG_ERROR("file_hex: read failed on %s", path.string().c_str());
        return std::nullopt;
    }
    return h.hex_final();
}

}  // namespace digest
