#include "stats/stats_collector.hpp"

namespace powminer
{
namespace stats
{

Collector::Collector(std::uint32_t worker_count)
: m_workers(worker_count)
, m_global_stats{}
, m_start_time{std::chrono::steady_clock::now()}
{
}

void Collector::reset_workers(std::uint32_t worker_count)
{
    std::scoped_lock lock(m_mutex);
    m_workers.assign(worker_count, Hash{});
    m_start_time = std::chrono::steady_clock::now();
}

void Collector::update_global_stats(Global const& stats)
{
    std::scoped_lock lock(m_mutex);
    m_global_stats += stats;
}

void Collector::update_worker_stats(std::uint32_t internal_worker_id, Hash const& stats)
{
    std::scoped_lock lock(m_mutex);
    if (internal_worker_id >= m_workers.size())
    {
        return;
    }
    m_workers[internal_worker_id] = stats;
}

std::vector<Hash> Collector::get_workers_stats() const
{
    std::scoped_lock lock(m_mutex);
    return m_workers;
}

Hash Collector::get_total_stats() const
{
    std::scoped_lock lock(m_mutex);
    Hash total{};
    for (auto const& worker : m_workers)
    {
        total += worker;
    }
    return total;
}

Global Collector::get_global_stats() const
{
    std::scoped_lock lock(m_mutex);
    return m_global_stats;
}

std::chrono::duration<double> Collector::get_elapsed_time_seconds() const
{
    std::scoped_lock lock(m_mutex);
    return std::chrono::steady_clock::now() - m_start_time;
}

}
}
