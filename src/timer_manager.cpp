#include "timer_manager.hpp"
#include "stats/stats_collector.hpp"
#include "stats/stats_printer.hpp"
#include "pow/search.hpp"

#include <asio/post.hpp>

namespace powminer
{
Timer_manager::Timer_manager(std::shared_ptr<asio::io_context> io_context)
: m_io_context{std::move(io_context)}
, m_stats_collector_timer{std::make_unique<chrono::Timer>(m_io_context)}
, m_stats_printer_timer{std::make_unique<chrono::Timer>(m_io_context)}
{
}

void Timer_manager::start_stats_collector_timer(std::uint16_t timer_interval, std::weak_ptr<pow::Search> search,
    std::shared_ptr<stats::Collector> stats_collector)
{
    asio::post(*m_io_context, [this, timer_interval, search = std::move(search), stats_collector = std::move(stats_collector)]()
    {
        m_stats_collector_timer->start(chrono::Seconds(timer_interval), [search, stats_collector]()
        {
            auto search_shared = search.lock();
            if (!search_shared)
            {
                // search finished, nothing left to collect
                return false;
            }
            search_shared->update_statistics(*stats_collector);
            return true;
        });
    });
}

void Timer_manager::start_stats_printer_timer(std::uint16_t timer_interval, std::vector<std::shared_ptr<stats::Printer>> stats_printers)
{
    asio::post(*m_io_context, [this, timer_interval, stats_printers = std::move(stats_printers)]()
    {
        m_stats_printer_timer->start(chrono::Seconds(timer_interval), [stats_printers]()
        {
            for (auto& stats_printer : stats_printers)
            {
                stats_printer->print();
            }
            return true;
        });
    });
}

void Timer_manager::stop()
{
    asio::post(*m_io_context, [this]()
    {
        m_stats_collector_timer->cancel();
        m_stats_printer_timer->cancel();
    });
}

}
