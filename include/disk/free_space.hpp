#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace disk
{

struct Usage
{
    std::uint64_t available_bytes{0};
    double        free_percent{0.0};
};

std::optional<Usage> usage_of(const std::filesystem::path &dir);

// False when `dir`'s filesystem is below `min_free_percent` or cannot hold `bytes_needed`.
// A filesystem that cannot be queried passes with a warning.
bool check_free_space(const std::filesystem::path &dir,
                      std::uint64_t                bytes_needed,
                      int                          min_free_percent);

}  // namespace disk
