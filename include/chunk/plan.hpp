#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace chunk
{

// Operator-configured maximum object size on the remote store.
struct ChunkSpec
{
    std::uint64_t chunk_size_bytes{0};
};

struct ChunkPlan
{
    std::uint64_t item_size{0};
    std::uint64_t expected_count{1};
    std::uint64_t expected_first_chunk_size{0};  // last chunk is exempt
};

// nullopt when chunk_size_bytes == 0.
std::optional<ChunkPlan> make_plan(std::uint64_t item_size, std::uint64_t chunk_size_bytes);

// Equal to the threshold still goes out as a single object.
inline bool needs_chunking(std::uint64_t item_size, const ChunkSpec &spec)
{
    return item_size > spec.chunk_size_bytes;
}

// Sizes the splitter will produce for this plan, in ordinal order.
std::vector<std::uint64_t> chunk_sizes(const ChunkPlan &plan);

}  // namespace chunk
