#include <gtest/gtest.h>
#include "pow/sequential_search.hpp"
#include "pow/engine.hpp"
#include "stats/stats_collector.hpp"

#include <string>

namespace
{
using namespace ::powminer::pow;

Payload to_payload(std::string const& text)
{
    return Payload{text.begin(), text.end()};
}

TEST(Sequential_search, finds_smallest_nonce)
{
    struct Vector { Payload payload; std::uint32_t difficulty; std::uint64_t nonce; };
    std::vector<Vector> const vectors{
        {Payload{}, 1, 20},
        {Payload{}, 2, 477},
        {to_payload("hello world"), 2, 347},
        {to_payload("hello world"), 3, 966},
        {to_payload("blockchain"), 4, 8165},
        {Payload{1, 2, 3, 4, 5}, 2, 74},
    };

    for (auto const& vector : vectors)
    {
        Sequential_search search{vector.payload, vector.difficulty};
        auto const outcome = search.run();
        ASSERT_TRUE(outcome.found());
        EXPECT_EQ(outcome.nonce(), vector.nonce);
    }
}

TEST(Sequential_search, no_smaller_nonce_is_valid)
{
    auto const payload = to_payload("hello world");
    Sequential_search search{payload, 3};
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_TRUE(valid(payload, outcome.nonce(), 3));
    for (std::uint64_t nonce = 0; nonce < outcome.nonce(); ++nonce)
    {
        EXPECT_FALSE(valid(payload, nonce, 3)) << nonce;
    }
}

TEST(Sequential_search, difficulty_zero_returns_first_nonce)
{
    Sequential_search search{to_payload("test data"), 0};
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.nonce(), 0U);

    Sequential_search offset{to_payload("test data"), 0, Search_limits{}, Nonce_range{42, 100}};
    EXPECT_EQ(offset.run().nonce(), 42U);
}

TEST(Sequential_search, difficulty_above_64_is_rejected)
{
    Sequential_search search{to_payload("test"), 65};
    EXPECT_EQ(search.run().result(), Result::difficulty_too_high);
}

TEST(Sequential_search, exhausted_range_reports_no_solution)
{
    // the first valid nonce for the empty payload at difficulty 1 is 20
    Sequential_search search{Payload{}, 1, Search_limits{}, Nonce_range{0, 19}};
    EXPECT_EQ(search.run().result(), Result::no_solution_found);
}

TEST(Sequential_search, attempt_budget_aborts_high_difficulty)
{
    Search_limits limits;
    limits.m_abort_difficulty = 0;
    limits.m_check_interval = 10;
    limits.m_max_attempts = 100;

    Sequential_search search{to_payload("test"), 64, limits};
    EXPECT_EQ(search.run().result(), Result::search_aborted);

    // nonces 0..110 were tried, 110 is the first checkpoint past the budget
    ::powminer::stats::Collector collector{1};
    search.update_statistics(collector);
    EXPECT_EQ(collector.get_workers_stats()[0].m_hash_count, 111U);
}

TEST(Sequential_search, attempt_budget_ignores_low_difficulty)
{
    Search_limits limits;
    limits.m_abort_difficulty = 2;
    limits.m_check_interval = 1;
    limits.m_max_attempts = 1;

    // difficulty 2 is not above the abort difficulty, the search runs until nonce 347
    Sequential_search search{to_payload("hello world"), 2, limits};
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.nonce(), 347U);
}

TEST(Search_limits, defaults)
{
    Search_limits const limits;
    EXPECT_EQ(limits.m_abort_difficulty, 20U);
    EXPECT_EQ(limits.m_check_interval, 1000000U);
    EXPECT_EQ(limits.m_max_attempts, 100000000U);

    EXPECT_FALSE(limits.exceeded(21, 100000000));
    EXPECT_TRUE(limits.exceeded(21, 101000000));
    EXPECT_FALSE(limits.exceeded(21, 101000001));
    EXPECT_FALSE(limits.exceeded(20, 101000000));
    EXPECT_FALSE(limits.exceeded(64, 0));
}

TEST(Sequential_search, stopped_search_is_cancelled)
{
    Sequential_search search{to_payload("test"), 64};
    search.stop();
    EXPECT_EQ(search.run().result(), Result::search_cancelled);
}

TEST(Sequential_search, runs_only_once)
{
    Sequential_search search{to_payload("test"), 1};
    EXPECT_TRUE(search.run().found());
    EXPECT_EQ(search.run().result(), Result::error);
}

TEST(Sequential_search, statistics)
{
    Sequential_search search{to_payload("blockchain"), 4};
    ASSERT_TRUE(search.run().found());

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    auto const hash_stats = collector.get_workers_stats()[0];
    EXPECT_EQ(hash_stats.m_hash_count, 8166U);
    EXPECT_GE(hash_stats.m_best_leading_zeros, 4U);
    EXPECT_EQ(hash_stats.m_met_difficulty_count, 1U);
}

}
