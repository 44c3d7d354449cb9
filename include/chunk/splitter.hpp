#pragma once
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "chunk/chunk_set.hpp"
#include "chunk/errors.hpp"
#include "chunk/naming.hpp"

/*
split:
  input stream ──read──> [chunk_size bytes] -> out_dir/<name>.001.partial -> rename <name>.001
                         [chunk_size bytes] -> out_dir/<name>.002.partial -> rename <name>.002
                         [remainder]        -> out_dir/<name>.003.partial -> rename <name>.003

reassemble:
  ChunkSet (ordinal order) ──concat──> ostream
*/

namespace chunk
{

struct SplitResult
{
    bool               ok{false};
    std::vector<Chunk> chunks;
    std::uint64_t      bytes{0};
    std::string        digest_hex;  // BLAKE2b-256 of the input stream
    Error              error;
};

struct ReassembleResult
{
    bool          ok{false};
    std::uint64_t bytes{0};
    std::string   digest_hex;  // BLAKE2b-256 of the reproduced stream
    Error         error;
};

// Splits `input` into chunks named after `source_name` in `style`, written to `out_dir`.
// On failure nothing produced by this call is left behind.
SplitResult split_file(const std::filesystem::path &input,
                       const std::filesystem::path &out_dir,
                       std::string_view             source_name,
                       NameStyle                    style,
                       std::uint64_t                chunk_size);

ReassembleResult reassemble(const ChunkSet &set, std::ostream &out);

// Removes chunk files, returns how many could not be removed.
std::size_t remove_chunks(const std::vector<Chunk> &chunks);

}  // namespace chunk
