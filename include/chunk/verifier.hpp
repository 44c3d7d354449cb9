#pragma once
#include <cstdint>
#include <string>

#include "chunk/chunk_set.hpp"
#include "chunk/plan.hpp"

namespace chunk
{

// Bit flags so a verdict can carry any combination of failed checks.
enum Check : std::uint8_t
{
    CHECK_NONE         = 0,
    CHECK_COUNT        = 1 << 0,
    CHECK_TOTAL_SIZE   = 1 << 1,
    CHECK_LEADING_SIZE = 1 << 2,
};

// Leading chunk may differ from the configured size by this much.
inline constexpr std::uint64_t LEADING_TOLERANCE = 1;

struct Verdict
{
    std::uint8_t failed{CHECK_NONE};

    bool valid() const { return failed == CHECK_NONE; }
    bool has(Check c) const { return (failed & c) != 0; }
};

// All-or-nothing: any failed check makes the whole set untrustworthy.
Verdict verify(const ChunkSet &set, const ChunkPlan &plan);

// "COUNT,LEADING_SIZE" style rendering for logs and the CLI.
std::string describe(const Verdict &v);

}  // namespace chunk
