#pragma once
#include <filesystem>
#include <string_view>

#include "chunk/chunk_set.hpp"
#include "chunk/errors.hpp"

namespace chunk
{

struct ScanResult
{
    bool     ok{false};
    ChunkSet set;
    Error    error;
};

// Collects the chunk artifacts of `source_name` in `sidecar_dir`, both naming styles,
// ordered by ordinal. A missing sidecar directory is an empty set, not an error.
ScanResult scan_chunks(std::string_view source_name, const std::filesystem::path &sidecar_dir);

}  // namespace chunk
