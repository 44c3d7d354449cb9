#include "chunk/verifier.hpp"
#include "util/log.hpp"

namespace chunk
{

Verdict verify(const ChunkSet &set, const ChunkPlan &plan)
{
    Verdict v;

    // 1) count, with ordinals 1..n in one naming style
    if (set.count() != plan.expected_count || !set.contiguous())
    {
        LOG_WARN("verify: expected %llu chunk(s), found %zu%s",
                 (unsigned long long)plan.expected_count, set.count(),
                 set.contiguous() ? "" : " (gaps or mixed naming)");
        v.failed |= CHECK_COUNT;
    }
    else
    {
        LOG_DEBUG("verify: chunk count %zu matches", set.count());
    }

    // 2) total size, zero tolerance
    if (set.total_bytes != plan.item_size)
    {
        LOG_WARN("verify: chunks hold %llu bytes, item has %llu",
                 (unsigned long long)set.total_bytes, (unsigned long long)plan.item_size);
        v.failed |= CHECK_TOTAL_SIZE;
    }
    else
    {
        LOG_DEBUG("verify: total size %llu matches", (unsigned long long)set.total_bytes);
    }

    // 3) leading chunk against the configured size: catches a changed chunk size
    if (set.empty())
    {
        v.failed |= CHECK_LEADING_SIZE;
    }
    else if (plan.expected_count == 1 && set.count() == 1)
    {
        // the only chunk is also the last one, its size is covered by check 2
        LOG_DEBUG("verify: single chunk, leading size not applicable");
    }
    else
    {
        const std::uint64_t first = set.chunks.front().size;
        const std::uint64_t want  = plan.expected_first_chunk_size;
        const std::uint64_t diff  = first > want ? first - want : want - first;
        if (diff > LEADING_TOLERANCE)
        {
            LOG_WARN("verify: first chunk is %llu bytes, configured chunk size is %llu",
                     (unsigned long long)first, (unsigned long long)want);
            v.failed |= CHECK_LEADING_SIZE;
        }
        else
        {
            LOG_DEBUG("verify: first chunk size within %llu byte(s) of %llu",
                      (unsigned long long)LEADING_TOLERANCE, (unsigned long long)want);
        }
    }
    return v;
}

std::string describe(const Verdict &v)
{
    if (v.valid())
        return "VALID";
    std::string out;
    auto add = [&](Check c, const char *label) {
        if (!v.has(c))
            return;
        if (!out.empty())
            out += ',';
        out += label;
    };
    add(CHECK_COUNT, "COUNT");
    add(CHECK_TOTAL_SIZE, "TOTAL_SIZE");
    add(CHECK_LEADING_SIZE, "LEADING_SIZE");
    return "INVALID(" + out + ")";
}

}  // namespace chunk
