#ifndef POWMINER_JOB_RUNNER_HPP
#define POWMINER_JOB_RUNNER_HPP

#include "timer_manager.hpp"
#include "pow/types.hpp"
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace asio { class io_context; }

namespace powminer
{
namespace config { class Config; class Job_config; }
namespace stats { class Collector; class Printer_console; }
namespace pow { class Search; }

struct Job_result
{
    std::string m_id;
    pow::Search_outcome m_outcome;
    std::string m_hash;
    std::chrono::duration<double> m_elapsed{0.0};
};

class Job_runner
{
public:

    using Config = config::Config;

    Job_runner(std::shared_ptr<asio::io_context> io_context, Config& config);

    // runs all configured jobs in order. Returns true if every job found a valid nonce.
    bool run_jobs();

    Job_result run_job(config::Job_config const& job_config);

    // cancel the running search and skip the remaining jobs. Thread safe.
    void stop();

    std::shared_ptr<stats::Collector> get_stats_collector() const { return m_stats_collector; }

private:

    std::shared_ptr<pow::Search> create_search(config::Job_config const& job_config) const;
    void report(config::Job_config const& job_config, Job_result const& result);

    std::shared_ptr<::asio::io_context> m_io_context;
    Config& m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<stats::Collector> m_stats_collector;
    std::shared_ptr<stats::Printer_console> m_stats_printer;
    Timer_manager m_timer_manager;

    std::atomic<bool> m_stop;
    std::mutex m_search_mutex;
    std::shared_ptr<pow::Search> m_current_search;
};
}

#endif
