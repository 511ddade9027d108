#include "stats/stats_printer_console.hpp"
#include "stats/stats_collector.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>
#include <iomanip>

namespace powminer
{
namespace stats
{

Printer_console::Printer_console(Collector& stats_collector)
: m_stats_collector{stats_collector}
, m_logger{spdlog::get("statistics")}
{
    if (!m_logger)
    {
        m_logger = spdlog::stdout_color_mt("statistics");
        m_logger->set_pattern("[%D %H:%M:%S.%e][%^%n%$] %v");
    }
}

void Printer_console::set_job_id(std::string job_id)
{
    std::scoped_lock lock(m_job_id_mutex);
    m_job_id = std::move(job_id);
}

std::string Printer_console::format() const
{
    std::string job_id;
    {
        std::scoped_lock lock(m_job_id_mutex);
        job_id = m_job_id;
    }
    auto const global_stats = m_stats_collector.get_global_stats();
    auto const elapsed = m_stats_collector.get_elapsed_time_seconds().count();

    std::stringstream ss;
    ss << std::setprecision(2) << std::fixed;
    ss << "Job " << job_id << " seconds elapsed: " << elapsed;
    ss << " Jobs solved: " << global_stats.m_jobs_solved
        << " failed: " << global_stats.m_jobs_failed
        << " cancelled: " << global_stats.m_jobs_cancelled << std::endl;

    auto const workers = m_stats_collector.get_workers_stats();
    auto worker_index = 0U;
    for (auto const& hash_stats : workers)
    {
        ss << "Worker " << worker_index << " stats: ";
        double const rate = elapsed > 0.0 ? hash_stats.m_hash_count / elapsed : 0.0;
        ss << (rate / 1.0e6) << "MH/s. ";
        ss << hash_stats.m_hash_count << " hashes. Most difficult: " << hash_stats.m_best_leading_zeros;
        if (hash_stats.m_hash_error_count > 0)
        {
            ss << " Errors: " << hash_stats.m_hash_error_count;
        }
        worker_index++;
        ss << std::endl;
    }
    return ss.str();
}

void Printer_console::print()
{
    m_logger->info(format());
}

}
}
