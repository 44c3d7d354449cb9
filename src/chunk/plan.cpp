#include "chunk/plan.hpp"
#include "util/log.hpp"

namespace chunk
{

std::optional<ChunkPlan> make_plan(std::uint64_t item_size, std::uint64_t chunk_size_bytes)
{
    if (chunk_size_bytes == 0)
    {
        LOG_ERROR("make_plan: chunk size must be > 0");
        return std::nullopt;
    }
    ChunkPlan p;
    p.item_size                 = item_size;
    p.expected_count            = item_size / chunk_size_bytes + (item_size % chunk_size_bytes ? 1 : 0);
    p.expected_first_chunk_size = chunk_size_bytes;
    if (p.expected_count == 0)
        p.expected_count = 1;  // empty item still occupies one (empty) chunk
    return p;
}

std::vector<std::uint64_t> chunk_sizes(const ChunkPlan &plan)
{
    std::vector<std::uint64_t> out;
    const std::uint64_t        c = plan.expected_first_chunk_size;
    if (c == 0)
        return out;
    out.reserve(static_cast<std::size_t>(plan.expected_count));
    std::uint64_t left = plan.item_size;
    for (std::uint64_t i = 0; i < plan.expected_count; ++i)
    {
        const std::uint64_t take = left < c ? left : c;
        out.push_back(take);
        left -= take;
    }
    return out;
}

}  // namespace chunk
