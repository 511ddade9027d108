#ifndef POWMINER_TIMER_MANAGER_HPP
#define POWMINER_TIMER_MANAGER_HPP

#include "chrono/timer.hpp"

#include <memory>
#include <vector>

namespace asio { class io_context; }

namespace powminer
{
namespace stats
{
    class Printer;
    class Collector;
}
namespace pow { class Search; }

// Owns the periodic timers. All methods may be called from any thread, the work is posted to the io_context.
class Timer_manager
{
public:

    explicit Timer_manager(std::shared_ptr<asio::io_context> io_context);

    void start_stats_collector_timer(std::uint16_t timer_interval, std::weak_ptr<pow::Search> search,
        std::shared_ptr<stats::Collector> stats_collector);
    void start_stats_printer_timer(std::uint16_t timer_interval, std::vector<std::shared_ptr<stats::Printer>> stats_printers);

    void stop();

private:

    std::shared_ptr<asio::io_context> m_io_context;
    chrono::Timer::Uptr m_stats_collector_timer;
    chrono::Timer::Uptr m_stats_printer_timer;
};
}

#endif
