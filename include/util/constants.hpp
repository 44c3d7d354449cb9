#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{

// A bit below what the default remote (Box) accepts per object.
inline constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1200000000ULL;

// Per-directory sidecar holding chunk artifacts for the files of that directory.
inline constexpr std::string_view SIDECAR_DIR = ".rclone";

inline constexpr std::string_view ARCHIVE_EXT    = ".zip";
inline constexpr std::string_view PARTIAL_SUFFIX = ".partial";
inline constexpr std::size_t      ORDINAL_WIDTH  = 3;

inline constexpr std::array<std::string_view, 5> DEFAULT_SKIP_EXT = {
    ".bundle", ".tmp", ".temp", ".rclone", ".DS_Store"};

inline constexpr std::string_view DEFAULT_MOVER   = "rclone";
inline constexpr std::string_view DEFAULT_RCLONE  = "rclone";
inline constexpr std::string_view DEFAULT_SERVICE = "box";

inline constexpr int DEFAULT_MIN_FREE_PERCENT = 10;

// I/O buffer for split, archive and digest passes.
inline constexpr std::size_t IO_BUFFER = 1u << 20;

}  // namespace constants
