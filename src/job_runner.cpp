#include "job_runner.hpp"
#include "config/config.hpp"
#include "config/job_config.hpp"
#include "pow/engine.hpp"
#include "pow/logger.hpp"
#include "pow/parallel_search.hpp"
#include "pow/sequential_search.hpp"
#include "stats/stats_collector.hpp"
#include "stats/stats_printer_console.hpp"

#include <variant>

namespace powminer
{
Job_runner::Job_runner(std::shared_ptr<asio::io_context> io_context, Config& config)
: m_io_context{std::move(io_context)}
, m_config{config}
, m_logger{pow::get_logger()}
, m_stats_collector{std::make_shared<stats::Collector>()}
, m_stats_printer{std::make_shared<stats::Printer_console>(*m_stats_collector)}
, m_timer_manager{m_io_context}
, m_stop{false}
{
}

std::shared_ptr<pow::Search> Job_runner::create_search(config::Job_config const& job_config) const
{
    auto const& limits = m_config.get_search_limits();
    switch (job_config.m_mode)
    {
        case config::Search_mode::PARALLEL:
        {
            auto const& parallel = std::get<config::Job_config_parallel>(job_config.m_search_mode);
            return std::make_shared<pow::Parallel_search>(job_config.m_payload, job_config.m_difficulty,
                parallel.m_workers, limits);
        }
        case config::Search_mode::SEQUENTIAL:    // falltrough
        default:
        {
            return std::make_shared<pow::Sequential_search>(job_config.m_payload, job_config.m_difficulty, limits);
        }
    }
}

Job_result Job_runner::run_job(config::Job_config const& job_config)
{
    Job_result result;
    result.m_id = job_config.m_id;

    auto search = create_search(job_config);
    {
        std::scoped_lock lock(m_search_mutex);
        m_current_search = search;
    }
    // stop() may have been called before the search was published
    if (m_stop)
    {
        search->stop();
    }

    m_stats_collector->reset_workers(search->worker_count());
    m_stats_printer->set_job_id(job_config.m_id);

    auto const print_statistics_interval = m_config.get_print_statistics_interval();
    if (print_statistics_interval > 0)
    {
        m_timer_manager.start_stats_collector_timer(print_statistics_interval, search, m_stats_collector);
        m_timer_manager.start_stats_printer_timer(print_statistics_interval, {m_stats_printer});
    }

    m_logger->info("Job {}: searching difficulty {}", job_config.m_id, job_config.m_difficulty);
    auto const start = std::chrono::steady_clock::now();
    result.m_outcome = search->run();
    result.m_elapsed = std::chrono::steady_clock::now() - start;

    m_timer_manager.stop();
    search->update_statistics(*m_stats_collector);
    {
        std::scoped_lock lock(m_search_mutex);
        m_current_search.reset();
    }

    if (result.m_outcome.found())
    {
        // independent check of the result before reporting it
        if (pow::valid(job_config.m_payload, result.m_outcome.nonce(), job_config.m_difficulty))
        {
            result.m_hash = pow::get_hash(job_config.m_payload, result.m_outcome.nonce());
        }
        else
        {
            m_logger->error("Job {}: nonce {} fails validation", job_config.m_id, result.m_outcome.nonce());
            result.m_outcome = pow::Search_outcome{pow::Result::error};
        }
    }

    report(job_config, result);
    return result;
}

bool Job_runner::run_jobs()
{
    auto all_solved = true;
    for (auto const& job_config : m_config.get_job_config())
    {
        if (m_stop)
        {
            m_logger->warn("Job {}: skipped", job_config.m_id);
            all_solved = false;
            continue;
        }

        auto const result = run_job(job_config);
        if (!result.m_outcome.found())
        {
            all_solved = false;
        }
    }
    return all_solved;
}

void Job_runner::report(config::Job_config const& job_config, Job_result const& result)
{
    stats::Global global_stats{};
    if (result.m_outcome.found())
    {
        global_stats.m_jobs_solved = 1;
        m_logger->info("Job {}: nonce {} hash {} in {:.3f}s", job_config.m_id, result.m_outcome.nonce(),
            result.m_hash, result.m_elapsed.count());
    }
    else if (result.m_outcome.result() == pow::Result::search_cancelled)
    {
        global_stats.m_jobs_cancelled = 1;
        m_logger->warn("Job {}: {}", job_config.m_id, pow::Result::code_to_string(result.m_outcome.result()));
    }
    else
    {
        global_stats.m_jobs_failed = 1;
        m_logger->error("Job {}: {}", job_config.m_id, pow::Result::code_to_string(result.m_outcome.result()));
    }
    m_stats_collector->update_global_stats(global_stats);
    m_stats_printer->print();
}

void Job_runner::stop()
{
    m_stop = true;
    std::scoped_lock lock(m_search_mutex);
    if (m_current_search)
    {
        m_current_search->stop();
    }
}

}
