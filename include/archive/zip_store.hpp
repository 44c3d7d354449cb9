#pragma once
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "chunk/errors.hpp"

/*
Single-entry ZIP, method 0 (stored). Layout:

  [local header 30B + name (+ zip64 extra 20B)]
  [payload, byte for byte]
  [central header 46B + name (+ zip64 extra 20B)]
  [zip64 end record 56B + zip64 locator 20B]     only when zip64
  [end of central directory 22B]

No compression, so the container size depends on name length and payload size only.
*/

namespace archive
{

struct ArchiveResult
{
    bool          ok{false};
    std::uint64_t bytes{0};  // size of the written container
    chunk::Error  error;
};

bool needs_zip64(std::size_t name_len, std::uint64_t payload_size);

std::uint64_t stored_zip_size(std::string_view entry_name, std::uint64_t payload_size);

// Wraps `source` into `zip_path` under its file name. No partial file survives a failure.
ArchiveResult write_stored_zip(const std::filesystem::path &source,
                               const std::filesystem::path &zip_path);

}  // namespace archive
