#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "chunk/naming.hpp"
#include "chunk/verifier.hpp"

using namespace chunk;

static ChunkSet make_set(const std::vector<std::uint64_t> &sizes,
                         NameStyle                         style      = NameStyle::Archived,
                         std::uint32_t                     first_ord  = 1)
{
    ChunkSet s;
    std::uint32_t ord = first_ord;
    for (auto n : sizes)
    {
        Chunk c;
        c.ordinal = ord;
        c.style   = style;
        c.name    = format_chunk_name("item.bin", style, ord);
        c.path    = c.name;
        c.size    = n;
        s.total_bytes += n;
        s.chunks.push_back(c);
        ++ord;
    }
    return s;
}

static ChunkPlan plan_for(std::uint64_t size, std::uint64_t chunk)
{
    auto p = make_plan(size, chunk);
    EXPECT_TRUE(p.has_value());
    return *p;
}

TEST(Verifier, SplitterShapedSetIsValid)
{
    const auto plan = plan_for(2500, 1000);
    const auto v    = verify(make_set(chunk_sizes(plan)), plan);
    EXPECT_TRUE(v.valid());
    EXPECT_EQ(describe(v), "VALID");
}

TEST(Verifier, SingleChunkSetOfSingleChunkPlanIgnoresLeadingSize)
{
    const auto plan = plan_for(400, 1000);
    EXPECT_TRUE(verify(make_set({400}), plan).valid());
}

TEST(Verifier, RaisedChunkSizeFailsLeadingEvenForOneExpectedChunk)
{
    // cut at 1000, configuration now fits the whole item in one chunk
    const auto plan = plan_for(2500, 5000);
    ASSERT_EQ(plan.expected_count, 1u);
    const auto v = verify(make_set({1000, 1000, 500}), plan);
    EXPECT_TRUE(v.has(CHECK_COUNT));
    EXPECT_TRUE(v.has(CHECK_LEADING_SIZE));
    EXPECT_FALSE(v.has(CHECK_TOTAL_SIZE));
    EXPECT_EQ(describe(v), "INVALID(COUNT,LEADING_SIZE)");
}

TEST(Verifier, MissingChunkFailsCountAndTotal)
{
    const auto plan = plan_for(2500, 1000);
    const auto v    = verify(make_set({1000, 1000}), plan);
    EXPECT_TRUE(v.has(CHECK_COUNT));
    EXPECT_TRUE(v.has(CHECK_TOTAL_SIZE));
    EXPECT_FALSE(v.has(CHECK_LEADING_SIZE));
    EXPECT_EQ(describe(v), "INVALID(COUNT,TOTAL_SIZE)");
}

TEST(Verifier, TruncatedTailFailsTotalOnly)
{
    const auto plan = plan_for(2500, 1000);
    const auto v    = verify(make_set({1000, 1000, 499}), plan);
    EXPECT_FALSE(v.has(CHECK_COUNT));
    EXPECT_TRUE(v.has(CHECK_TOTAL_SIZE));
    EXPECT_FALSE(v.has(CHECK_LEADING_SIZE));
}

TEST(Verifier, ChangedChunkSizeFailsLeading)
{
    // chunks cut at 1.2 GB, configuration now says 0.9 GB
    const auto plan = plan_for(3000000000ULL, 900000000ULL);
    const auto v = verify(make_set({1200000000ULL, 1200000000ULL, 600000000ULL}), plan);
    EXPECT_FALSE(v.valid());
    EXPECT_TRUE(v.has(CHECK_COUNT));
    EXPECT_TRUE(v.has(CHECK_LEADING_SIZE));
    EXPECT_FALSE(v.has(CHECK_TOTAL_SIZE));
}

TEST(Verifier, SameCountDifferentCutFailsLeading)
{
    // 2500 bytes as 1100+1100+300 matches count and total for chunk size 1000
    const auto plan = plan_for(2500, 1000);
    const auto v    = verify(make_set({1100, 1100, 300}), plan);
    EXPECT_FALSE(v.has(CHECK_COUNT));
    EXPECT_FALSE(v.has(CHECK_TOTAL_SIZE));
    EXPECT_TRUE(v.has(CHECK_LEADING_SIZE));
}

TEST(Verifier, LeadingSizeToleratesOneByte)
{
    const auto plan = plan_for(2500, 1000);
    EXPECT_FALSE(verify(make_set({1001, 1000, 499}), plan).has(CHECK_LEADING_SIZE));
    EXPECT_FALSE(verify(make_set({999, 1000, 501}), plan).has(CHECK_LEADING_SIZE));
    EXPECT_TRUE(verify(make_set({1002, 1000, 498}), plan).has(CHECK_LEADING_SIZE));
    EXPECT_TRUE(verify(make_set({998, 1000, 502}), plan).has(CHECK_LEADING_SIZE));
}

TEST(Verifier, GapInOrdinalsFailsCount)
{
    const auto plan = plan_for(2500, 1000);
    auto       set  = make_set({1000, 1000, 500});
    set.chunks[2].ordinal = 4;
    EXPECT_TRUE(verify(set, plan).has(CHECK_COUNT));
}

TEST(Verifier, MixedStylesFailCount)
{
    const auto plan = plan_for(2000, 1000);
    auto       set  = make_set({1000, 1000});
    set.chunks[1].style = NameStyle::Raw;
    EXPECT_TRUE(verify(set, plan).has(CHECK_COUNT));
}

TEST(Verifier, EmptySetFailsEverything)
{
    const auto plan = plan_for(2500, 1000);
    const auto v    = verify(ChunkSet{}, plan);
    EXPECT_TRUE(v.has(CHECK_COUNT));
    EXPECT_TRUE(v.has(CHECK_TOTAL_SIZE));
    EXPECT_TRUE(v.has(CHECK_LEADING_SIZE));
}
