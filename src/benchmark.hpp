#ifndef POWMINER_BENCHMARK_HPP
#define POWMINER_BENCHMARK_HPP

#include "pow/types.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <mutex>

namespace powminer
{
namespace pow { class Search; }

// Sequential vs parallel timing, difficulty scaling, worker scaling and hash rate.
class Benchmark
{
public:

    explicit Benchmark(pow::Search_limits limits);

    // false if one of the searches did not find a nonce or the benchmark was stopped
    bool run();

    // cancel the running search and skip the remaining sections. Thread safe.
    void stop();

private:

    pow::Search_outcome run_search(std::shared_ptr<pow::Search> search);

    bool sequential_vs_parallel();
    bool difficulty_scaling();
    bool worker_scaling();
    bool hash_rate();

    std::shared_ptr<spdlog::logger> m_logger;
    pow::Search_limits m_limits;

    std::atomic<bool> m_stop;
    std::mutex m_search_mutex;
    std::shared_ptr<pow::Search> m_current_search;
};

}

#endif
