#include <gtest/gtest.h>
#include "pow/partition.hpp"

#include <limits>

namespace
{
using namespace ::powminer::pow;

constexpr auto max_nonce = std::numeric_limits<std::uint64_t>::max();

TEST(Partition, single_worker_gets_the_full_space)
{
    auto const ranges = partition(Nonce_range::full(), 1);
    ASSERT_EQ(ranges.size(), 1U);
    EXPECT_EQ(ranges[0].m_first, 0U);
    EXPECT_EQ(ranges[0].m_last, max_nonce);
}

TEST(Partition, chunk_is_two_to_the_64_divided_by_workers)
{
    auto const ranges = partition(Nonce_range::full(), 4);
    ASSERT_EQ(ranges.size(), 4U);
    std::uint64_t const chunk = 1ULL << 62;
    for (std::uint64_t i = 0; i < 4; ++i)
    {
        EXPECT_EQ(ranges[i].m_first, i * chunk);
    }
    EXPECT_EQ(ranges[0].m_last, chunk - 1);
    EXPECT_EQ(ranges[3].m_last, max_nonce);

    auto const thirds = partition(Nonce_range::full(), 3);
    ASSERT_EQ(thirds.size(), 3U);
    EXPECT_EQ(thirds[1].m_first, 6148914691236517205ULL);
    EXPECT_EQ(thirds[2].m_first, 2 * 6148914691236517205ULL);
    EXPECT_EQ(thirds[2].m_last, max_nonce);
}

TEST(Partition, ranges_cover_the_space_exactly_once)
{
    for (std::uint32_t workers = 1; workers <= 64; ++workers)
    {
        auto const ranges = partition(Nonce_range::full(), workers);
        ASSERT_EQ(ranges.size(), workers);
        EXPECT_EQ(ranges.front().m_first, 0U);
        EXPECT_EQ(ranges.back().m_last, max_nonce);
        for (std::size_t i = 1; i < ranges.size(); ++i)
        {
            EXPECT_LE(ranges[i - 1].m_first, ranges[i - 1].m_last);
            EXPECT_EQ(ranges[i].m_first, ranges[i - 1].m_last + 1) << "workers " << workers << " index " << i;
        }
    }
}

TEST(Partition, last_range_absorbs_remainder)
{
    auto const ranges = partition(Nonce_range{0, 9}, 3);
    ASSERT_EQ(ranges.size(), 3U);
    EXPECT_EQ(ranges[0].m_first, 0U);
    EXPECT_EQ(ranges[0].m_last, 2U);
    EXPECT_EQ(ranges[1].m_first, 3U);
    EXPECT_EQ(ranges[1].m_last, 5U);
    EXPECT_EQ(ranges[2].m_first, 6U);
    EXPECT_EQ(ranges[2].m_last, 9U);
}

TEST(Partition, small_range_clamps_worker_count)
{
    auto const ranges = partition(Nonce_range{10, 12}, 8);
    ASSERT_EQ(ranges.size(), 3U);
    for (std::uint64_t i = 0; i < 3; ++i)
    {
        EXPECT_EQ(ranges[i].m_first, 10 + i);
        EXPECT_EQ(ranges[i].m_last, 10 + i);
    }
}

TEST(Partition, invalid_input_yields_no_ranges)
{
    EXPECT_TRUE(partition(Nonce_range::full(), 0).empty());
    EXPECT_TRUE(partition(Nonce_range{5, 4}, 2).empty());
}

}
