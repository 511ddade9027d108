#ifndef POWMINER_STATS_COLLECTOR_HPP
#define POWMINER_STATS_COLLECTOR_HPP

#include "stats/types.hpp"
#include <vector>
#include <chrono>
#include <mutex>

namespace powminer {
namespace stats
{

class Collector {
public:

    explicit Collector(std::uint32_t worker_count = 0U);

    // starts a new job: drops the worker stats and restarts the job clock
    void reset_workers(std::uint32_t worker_count);

    void update_global_stats(Global const& stats);
    // workers report their absolute counters, the previous snapshot is replaced
    void update_worker_stats(std::uint32_t internal_worker_id, Hash const& stats);

    // copy of workers stats
    std::vector<Hash> get_workers_stats() const;
    // sum over all workers of the current job
    Hash get_total_stats() const;
    Global get_global_stats() const;

    std::chrono::duration<double> get_elapsed_time_seconds() const;

private:

    std::vector<Hash> m_workers;
    Global m_global_stats;
    std::chrono::steady_clock::time_point m_start_time;

    // worker stats are updated from the stats timer while the printer reads them
    mutable std::mutex m_mutex;
};

}
}
#endif
