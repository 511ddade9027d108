#include "pow/parallel_search.hpp"
#include "pow/partition.hpp"
#include "pow/logger.hpp"
#include "hash/pow_hasher.hpp"
#include "hash/difficulty.hpp"
#include "stats/stats_collector.hpp"

#include <exception>
#include <functional>
#include <stdexcept>
#include <system_error>

namespace powminer
{
namespace pow
{

Parallel_search::Parallel_search(Payload payload, std::uint32_t difficulty, std::uint32_t worker_count,
    Search_limits limits, Nonce_range range)
: m_logger{get_logger()}
, m_payload{std::move(payload)}
, m_difficulty{difficulty}
, m_requested_worker_count{worker_count}
, m_limits{limits}
, m_log_leader{"Parallel search: "}
, m_hasher_factory{[](Payload const& payload, std::uint32_t) { return std::make_unique<hash::Pow_hasher>(payload); }}
, m_started{false}
, m_stop{false}
, m_found{false}
, m_result_nonce{0}
{
    if (worker_count == 0 || worker_count > max_workers)
    {
        return;
    }

    auto const ranges = partition(range, worker_count);
    for (std::uint32_t id = 0; id < ranges.size(); ++id)
    {
        auto worker = std::make_unique<Worker>();
        worker->m_id = id;
        worker->m_range = ranges[id];
        worker->m_log_leader = "Worker " + std::to_string(id) + ": ";
        m_workers.push_back(std::move(worker));
    }
}

Parallel_search::~Parallel_search()
{
    //make sure all worker threads exit their loop
    m_stop = true;
    join_workers();
}

Search_outcome Parallel_search::run()
{
    if (m_difficulty > max_difficulty)
    {
        m_logger->error("{}Difficulty {} exceeds the maximum of {}", m_log_leader, m_difficulty, max_difficulty);
        return Search_outcome{Result::difficulty_too_high};
    }

    if (m_requested_worker_count == 0 || m_requested_worker_count > max_workers)
    {
        m_logger->error("{}Invalid number of workers {} (1-{})", m_log_leader, m_requested_worker_count, max_workers);
        return Search_outcome{Result::invalid_worker_count};
    }

    if (m_started.exchange(true))
    {
        m_logger->error("{}Search already started", m_log_leader);
        return Search_outcome{Result::error};
    }

    if (m_workers.size() < m_requested_worker_count)
    {
        m_logger->debug("{}Range too small for {} workers, using {}", m_log_leader, m_requested_worker_count, m_workers.size());
    }

    try
    {
        for (auto& worker : m_workers)
        {
            worker->m_thread = std::thread(&Parallel_search::run_worker, this, std::ref(*worker));
        }
    }
    catch (std::system_error const& e)
    {
        // release the workers that did start before reporting the failure
        m_logger->critical("{}Failed to start worker thread: {}", m_log_leader, e.what());
        m_stop = true;
        join_workers();
        throw;
    }

    join_workers();

    if (m_found.load(std::memory_order_relaxed))
    {
        return Search_outcome::success(m_result_nonce.load(std::memory_order_relaxed));
    }

    if (m_stop.load(std::memory_order_relaxed))
    {
        return Search_outcome{Result::search_cancelled};
    }

    std::size_t aborted = 0;
    for (auto const& worker : m_workers)
    {
        if (worker->m_aborted.load(std::memory_order_relaxed))
        {
            ++aborted;
        }
    }
    m_logger->warn("{}No valid nonce found by any of the {} workers ({} aborted)", m_log_leader, m_workers.size(), aborted);
    return Search_outcome{Result::no_solution_found};
}

void Parallel_search::run_worker(Worker& worker)
{
    m_logger->debug("{}Scanning {} - {}", worker.m_log_leader, worker.m_range.m_first, worker.m_range.m_last);
    try
    {
        auto hasher = m_hasher_factory(m_payload, worker.m_id);
        if (!hasher)
        {
            throw std::runtime_error("no hasher");
        }
        std::uint32_t best_leading_zeros = 0;

        for (auto nonce = worker.m_range.m_first; ; ++nonce)
        {
            if (is_terminated())
            {
                break;
            }

            auto const digest = hasher->calculate_hex(nonce);
            worker.m_hash_count.fetch_add(1, std::memory_order_relaxed);

            auto const zeros = hash::leading_zeros(digest);
            if (zeros > best_leading_zeros)
            {
                best_leading_zeros = zeros;
                worker.m_best_leading_zeros.store(zeros, std::memory_order_relaxed);
            }

            if (hash::meets_difficulty(digest, m_difficulty))
            {
                worker.m_met_difficulty_count.fetch_add(1, std::memory_order_relaxed);
                bool expected = false;
                if (m_found.compare_exchange_strong(expected, true, std::memory_order_relaxed))
                {
                    m_result_nonce.store(nonce, std::memory_order_relaxed);
                    m_logger->info("{}Found nonce {} hash {}", worker.m_log_leader, nonce, digest);
                }
                else
                {
                    m_logger->debug("{}Nonce {} valid but another worker was first", worker.m_log_leader, nonce);
                }
                break;
            }

            if (m_limits.exceeded(m_difficulty, nonce - worker.m_range.m_first))
            {
                worker.m_aborted = true;
                m_logger->warn("{}Difficulty {} too high, partition abandoned after {} attempts",
                    worker.m_log_leader, m_difficulty, nonce - worker.m_range.m_first + 1);
                break;
            }

            if (nonce == worker.m_range.m_last)
            {
                m_logger->debug("{}Partition exhausted", worker.m_log_leader);
                break;
            }
        }
    }
    catch (std::exception const& e)
    {
        // counts as this worker finding nothing, the siblings keep going
        worker.m_error_count.fetch_add(1, std::memory_order_relaxed);
        m_logger->error("{}Failed: {}", worker.m_log_leader, e.what());
    }
}

void Parallel_search::join_workers()
{
    for (auto& worker : m_workers)
    {
        if (worker->m_thread.joinable())
        {
            worker->m_thread.join();
        }
    }
}

bool Parallel_search::is_terminated() const
{
    return m_found.load(std::memory_order_relaxed) || m_stop.load(std::memory_order_relaxed);
}

void Parallel_search::stop()
{
    m_stop = true;
}

std::vector<Nonce_range> Parallel_search::get_partitions() const
{
    std::vector<Nonce_range> ranges;
    for (auto const& worker : m_workers)
    {
        ranges.push_back(worker->m_range);
    }
    return ranges;
}

void Parallel_search::update_statistics(stats::Collector& stats_collector)
{
    for (auto const& worker : m_workers)
    {
        stats::Hash hash_stats{};
        hash_stats.m_hash_count = worker->m_hash_count.load(std::memory_order_relaxed);
        hash_stats.m_best_leading_zeros = worker->m_best_leading_zeros.load(std::memory_order_relaxed);
        hash_stats.m_met_difficulty_count = worker->m_met_difficulty_count.load(std::memory_order_relaxed);
        hash_stats.m_hash_error_count = worker->m_error_count.load(std::memory_order_relaxed);

        stats_collector.update_worker_stats(worker->m_id, hash_stats);
    }
}

}
}
