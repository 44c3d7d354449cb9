#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunk/naming.hpp"

namespace chunk
{

// One physical chunk artifact in a sidecar directory.
struct Chunk
{
    std::uint32_t         ordinal{0};  // 1-based
    NameStyle             style{NameStyle::Archived};
    std::string           name;
    std::filesystem::path path;
    std::uint64_t         size{0};
};

// Everything found locally for one source item, ordered by ordinal.
struct ChunkSet
{
    std::vector<Chunk> chunks;
    std::uint64_t      total_bytes{0};

    std::size_t count() const { return chunks.size(); }
    bool        empty() const { return chunks.empty(); }

    // Ordinals are exactly 1..n and a single naming style is in use.
    bool contiguous() const
    {
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            if (chunks[i].ordinal != i + 1 || chunks[i].style != chunks.front().style)
                return false;
        }
        return true;
    }
};

}  // namespace chunk
