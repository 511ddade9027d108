#include "pow/sequential_search.hpp"
#include "pow/logger.hpp"
#include "hash/pow_hasher.hpp"
#include "hash/difficulty.hpp"
#include "stats/stats_collector.hpp"

namespace powminer
{
namespace pow
{

Sequential_search::Sequential_search(Payload payload, std::uint32_t difficulty, Search_limits limits, Nonce_range range)
: m_logger{get_logger()}
, m_payload{std::move(payload)}
, m_difficulty{difficulty}
, m_limits{limits}
, m_range{range}
, m_log_leader{"Sequential search: "}
, m_started{false}
, m_stop{false}
, m_hash_count{0}
, m_best_leading_zeros{0}
, m_met_difficulty_count{0}
{
}

Search_outcome Sequential_search::run()
{
    if (m_difficulty > max_difficulty)
    {
        m_logger->error("{}Difficulty {} exceeds the maximum of {}", m_log_leader, m_difficulty, max_difficulty);
        return Search_outcome{Result::difficulty_too_high};
    }

    if (m_started.exchange(true))
    {
        m_logger->error("{}Search already started", m_log_leader);
        return Search_outcome{Result::error};
    }

    hash::Pow_hasher hasher{m_payload};
    std::uint32_t best_leading_zeros = 0;

    m_logger->debug("{}Difficulty {} scanning {} - {}", m_log_leader, m_difficulty, m_range.m_first, m_range.m_last);
    for (auto nonce = m_range.m_first; ; ++nonce)
    {
        if (m_stop.load(std::memory_order_relaxed))
        {
            m_logger->info("{}Stopped at nonce {}", m_log_leader, nonce);
            return Search_outcome{Result::search_cancelled};
        }

        auto const digest = hasher.calculate_hex(nonce);
        m_hash_count.fetch_add(1, std::memory_order_relaxed);

        auto const zeros = hash::leading_zeros(digest);
        if (zeros > best_leading_zeros)
        {
            best_leading_zeros = zeros;
            m_best_leading_zeros.store(zeros, std::memory_order_relaxed);
        }

        if (hash::meets_difficulty(digest, m_difficulty))
        {
            m_met_difficulty_count.fetch_add(1, std::memory_order_relaxed);
            m_logger->info("{}Found nonce {} hash {}", m_log_leader, nonce, digest);
            return Search_outcome::success(nonce);
        }

        if (m_limits.exceeded(m_difficulty, nonce - m_range.m_first))
        {
            m_logger->warn("{}Difficulty {} too high, computation aborted after {} attempts", m_log_leader,
                m_difficulty, nonce - m_range.m_first + 1);
            return Search_outcome{Result::search_aborted};
        }

        if (nonce == m_range.m_last)
        {
            break;
        }
    }

    m_logger->warn("{}Range exhausted without a valid nonce", m_log_leader);
    return Search_outcome{Result::no_solution_found};
}

void Sequential_search::stop()
{
    m_stop = true;
}

void Sequential_search::update_statistics(stats::Collector& stats_collector)
{
    stats::Hash hash_stats{};
    hash_stats.m_hash_count = m_hash_count.load(std::memory_order_relaxed);
    hash_stats.m_best_leading_zeros = m_best_leading_zeros.load(std::memory_order_relaxed);
    hash_stats.m_met_difficulty_count = m_met_difficulty_count.load(std::memory_order_relaxed);

    stats_collector.update_worker_stats(0U, hash_stats);
}

}
}
