#include "pow/partition.hpp"

namespace powminer
{
namespace pow
{

std::vector<Nonce_range> partition(Nonce_range const& range, std::uint32_t count)
{
    std::vector<Nonce_range> ranges;
    if (count == 0 || range.m_last < range.m_first)
    {
        return ranges;
    }

    // range size is span + 1, which is 2^64 for the full range
    std::uint64_t const span = range.m_last - range.m_first;
    std::uint64_t effective_count = count;
    if (span < effective_count - 1)
    {
        effective_count = span + 1;
    }

    // floor((span + 1) / effective_count) without overflowing span + 1
    std::uint64_t const chunk = span / effective_count + ((span % effective_count == effective_count - 1) ? 1 : 0);

    for (std::uint64_t i = 0; i < effective_count; ++i)
    {
        Nonce_range sub_range;
        sub_range.m_first = range.m_first + i * chunk;
        sub_range.m_last = (i == effective_count - 1) ? range.m_last : range.m_first + (i + 1) * chunk - 1;
        ranges.push_back(sub_range);
    }
    return ranges;
}

}
}
