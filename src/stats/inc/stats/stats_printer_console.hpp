#ifndef POWMINER_STATS_PRINTER_CONSOLE_HPP
#define POWMINER_STATS_PRINTER_CONSOLE_HPP

#include "stats/stats_printer.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace powminer {
namespace stats
{
class Collector;

class Printer_console : public Printer {
public:

    explicit Printer_console(Collector& stats_collector);

    // name of the job the worker stats belong to. Thread safe, print() runs on the io thread.
    void set_job_id(std::string job_id);

    void print() override;

    std::string format() const;

private:

    Collector& m_stats_collector;
    std::shared_ptr<spdlog::logger> m_logger;
    mutable std::mutex m_job_id_mutex;
    std::string m_job_id;
};

}
}
#endif
