#include <gtest/gtest.h>
#include "hash/difficulty.hpp"

namespace
{
using namespace ::powminer::hash;

TEST(Difficulty, zero_difficulty_is_always_met)
{
    EXPECT_TRUE(meets_difficulty("ffff", 0));
    EXPECT_TRUE(meets_difficulty("", 0));
}

TEST(Difficulty, counts_leading_zero_characters)
{
    EXPECT_TRUE(meets_difficulty("00ab", 1));
    EXPECT_TRUE(meets_difficulty("00ab", 2));
    EXPECT_FALSE(meets_difficulty("00ab", 3));
    EXPECT_FALSE(meets_difficulty("a000", 1));
}

TEST(Difficulty, digest_shorter_than_difficulty_fails)
{
    EXPECT_FALSE(meets_difficulty("000", 4));
    EXPECT_FALSE(meets_difficulty("", 1));
    EXPECT_FALSE(meets_difficulty(std::string(64, '0'), 65));
    EXPECT_TRUE(meets_difficulty(std::string(64, '0'), 64));
}

TEST(Difficulty, leading_zeros)
{
    EXPECT_EQ(leading_zeros("000a0"), 3U);
    EXPECT_EQ(leading_zeros("a000"), 0U);
    EXPECT_EQ(leading_zeros("0000"), 4U);
    EXPECT_EQ(leading_zeros(""), 0U);
}

}
