#include <gtest/gtest.h>
#include "pow/parallel_search.hpp"
#include "pow/partition.hpp"
#include "pow/engine.hpp"
#include "hash/pow_hasher.hpp"
#include "stats/stats_collector.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace
{
using namespace ::powminer::pow;

Payload to_payload(std::string const& text)
{
    return Payload{text.begin(), text.end()};
}

// hasher construction fails for one worker, as an OpenSSL allocation failure would
Parallel_search::Hasher_factory failing_for(std::uint32_t failing_worker)
{
    return [failing_worker](Payload const& payload, std::uint32_t worker_id)
    {
        if (worker_id == failing_worker)
        {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        return std::make_unique<::powminer::hash::Pow_hasher>(payload);
    };
}

TEST(Parallel_search, finds_valid_nonce)
{
    auto const payload = to_payload("parallel test");
    for (std::uint32_t workers : {1U, 2U, 4U, 8U, 64U})
    {
        Parallel_search search{payload, 3, workers};
        EXPECT_EQ(search.worker_count(), workers);
        auto const outcome = search.run();
        ASSERT_TRUE(outcome.found()) << workers;
        EXPECT_TRUE(valid(payload, outcome.nonce(), 3)) << workers;
    }
}

TEST(Parallel_search, single_worker_matches_sequential_order)
{
    Parallel_search search{to_payload("single thread"), 2, 1};
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.nonce(), 95U);
}

TEST(Parallel_search, invalid_worker_count)
{
    Parallel_search none{to_payload("test"), 2, 0};
    EXPECT_EQ(none.worker_count(), 0U);
    EXPECT_EQ(none.run().result(), Result::invalid_worker_count);

    Parallel_search too_many{to_payload("test"), 2, 65};
    EXPECT_EQ(too_many.run().result(), Result::invalid_worker_count);
}

TEST(Parallel_search, difficulty_is_checked_before_worker_count)
{
    Parallel_search search{to_payload("test"), 65, 0};
    EXPECT_EQ(search.run().result(), Result::difficulty_too_high);

    Parallel_search valid_workers{to_payload("test"), 65, 4};
    EXPECT_EQ(valid_workers.run().result(), Result::difficulty_too_high);
}

TEST(Parallel_search, workers_scan_their_own_partition)
{
    // [0,19] holds no solution for the empty payload at difficulty 1, 20 is the first one
    Parallel_search search{Payload{}, 1, 2, Search_limits{}, Nonce_range{0, 39}};
    auto const partitions = search.get_partitions();
    ASSERT_EQ(partitions.size(), 2U);
    EXPECT_EQ(partitions[1].m_first, 20U);

    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.nonce(), 20U);
}

TEST(Parallel_search, exhausted_range_reports_no_solution)
{
    Parallel_search search{Payload{}, 1, 4, Search_limits{}, Nonce_range{0, 19}};
    EXPECT_EQ(search.run().result(), Result::no_solution_found);
}

TEST(Parallel_search, small_range_uses_fewer_workers)
{
    Parallel_search search{Payload{}, 1, 8, Search_limits{}, Nonce_range{19, 20}};
    EXPECT_EQ(search.worker_count(), 2U);
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.nonce(), 20U);
}

TEST(Parallel_search, partitions_follow_partition_function)
{
    Parallel_search search{to_payload("test"), 2, 4};
    auto const partitions = search.get_partitions();
    auto const expected = partition(Nonce_range::full(), 4);
    ASSERT_EQ(partitions.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(partitions[i].m_first, expected[i].m_first);
        EXPECT_EQ(partitions[i].m_last, expected[i].m_last);
    }
}

TEST(Parallel_search, every_worker_applies_its_own_attempt_budget)
{
    Search_limits limits;
    limits.m_abort_difficulty = 0;
    limits.m_check_interval = 10;
    limits.m_max_attempts = 100;

    Parallel_search search{to_payload("test"), 64, 4, limits};
    EXPECT_EQ(search.run().result(), Result::no_solution_found);

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    auto const workers = collector.get_workers_stats();
    ASSERT_EQ(workers.size(), 4U);
    for (auto const& hash_stats : workers)
    {
        EXPECT_EQ(hash_stats.m_hash_count, 111U);
        EXPECT_EQ(hash_stats.m_hash_error_count, 0U);
    }
    EXPECT_EQ(collector.get_total_stats().m_hash_count, 444U);
}

TEST(Parallel_search, stop_cancels_running_workers)
{
    Parallel_search search{to_payload("test"), 64, 4};
    auto result = std::async(std::launch::async, [&search]() { return search.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    search.stop();

    ASSERT_EQ(result.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    EXPECT_EQ(result.get().result(), Result::search_cancelled);
}

TEST(Parallel_search, winner_is_counted_once)
{
    Parallel_search search{to_payload("parallel test"), 2, 4};
    ASSERT_TRUE(search.run().found());

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    auto const total = collector.get_total_stats();
    EXPECT_GE(total.m_met_difficulty_count, 1U);
    EXPECT_GE(total.m_best_leading_zeros, 2U);
}

TEST(Parallel_search, failing_worker_counts_as_finding_nothing)
{
    // worker 0 owns [0, 9], worker 1 owns [10, 19]. The first valid nonce (20) is outside both.
    Parallel_search search{Payload{}, 1, 2, Search_limits{}, Nonce_range{0, 19}};
    search.set_hasher_factory(failing_for(0));
    EXPECT_EQ(search.run().result(), Result::no_solution_found);

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    auto const workers = collector.get_workers_stats();
    ASSERT_EQ(workers.size(), 2U);
    EXPECT_EQ(workers[0].m_hash_error_count, 1U);
    EXPECT_EQ(workers[0].m_hash_count, 0U);
    EXPECT_EQ(workers[1].m_hash_error_count, 0U);
    EXPECT_EQ(workers[1].m_hash_count, 10U);
    EXPECT_EQ(collector.get_total_stats().m_hash_error_count, 1U);
}

TEST(Parallel_search, siblings_of_failing_worker_still_find_nonce)
{
    auto const payload = to_payload("parallel test");
    Parallel_search search{payload, 3, 4};
    search.set_hasher_factory(failing_for(1));
    auto const outcome = search.run();
    ASSERT_TRUE(outcome.found());
    EXPECT_TRUE(valid(payload, outcome.nonce(), 3));

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    EXPECT_EQ(collector.get_total_stats().m_hash_error_count, 1U);
    EXPECT_EQ(collector.get_workers_stats()[1].m_hash_count, 0U);
}

TEST(Parallel_search, failing_only_worker_does_not_hang)
{
    Parallel_search search{to_payload("test"), 1, 1};
    search.set_hasher_factory(failing_for(0));

    auto result = std::async(std::launch::async, [&search]() { return search.run(); });
    ASSERT_EQ(result.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    EXPECT_EQ(result.get().result(), Result::no_solution_found);

    ::powminer::stats::Collector collector{search.worker_count()};
    search.update_statistics(collector);
    EXPECT_EQ(collector.get_total_stats().m_hash_error_count, 1U);
}

}
