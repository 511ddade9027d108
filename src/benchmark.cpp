#include "benchmark.hpp"
#include "pow/engine.hpp"
#include "pow/logger.hpp"
#include "pow/parallel_search.hpp"
#include "pow/sequential_search.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace powminer
{
namespace
{
pow::Payload to_payload(std::string const& text)
{
    return pow::Payload{text.begin(), text.end()};
}

template<typename Function>
double time_ms(Function&& function)
{
    auto const start = std::chrono::steady_clock::now();
    function();
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}
}

Benchmark::Benchmark(pow::Search_limits limits)
: m_logger{pow::get_logger()}
, m_limits{limits}
, m_stop{false}
{
}

bool Benchmark::run()
{
    m_logger->info("=== Proof of work benchmark ===");
    std::vector<std::function<bool()>> const sections{
        [this] { return sequential_vs_parallel(); },
        [this] { return difficulty_scaling(); },
        [this] { return worker_scaling(); },
        [this] { return hash_rate(); }};

    auto result = true;
    for (auto const& section : sections)
    {
        if (m_stop)
        {
            m_logger->warn("=== Benchmark stopped ===");
            return false;
        }
        result &= section();
    }
    m_logger->info("=== Benchmark completed ===");
    return result && !m_stop;
}

void Benchmark::stop()
{
    m_stop = true;
    std::scoped_lock lock(m_search_mutex);
    if (m_current_search)
    {
        m_current_search->stop();
    }
}

pow::Search_outcome Benchmark::run_search(std::shared_ptr<pow::Search> search)
{
    {
        std::scoped_lock lock(m_search_mutex);
        m_current_search = search;
    }
    // stop() may have been called before the search was published
    if (m_stop)
    {
        search->stop();
    }

    auto const outcome = search->run();
    {
        std::scoped_lock lock(m_search_mutex);
        m_current_search.reset();
    }
    return outcome;
}

bool Benchmark::sequential_vs_parallel()
{
    auto const payload = to_payload("benchmark_test_data");
    std::uint32_t const difficulty = 4;

    pow::Search_outcome sequential;
    pow::Search_outcome parallel;
    auto const sequential_time = time_ms([&] { sequential = run_search(std::make_shared<pow::Sequential_search>(payload, difficulty, m_limits)); });
    auto const parallel_time = time_ms([&] { parallel = run_search(std::make_shared<pow::Parallel_search>(payload, difficulty, 4, m_limits)); });
    if (!sequential.found() || !parallel.found())
    {
        m_logger->error("Sequential vs parallel: no nonce found");
        return false;
    }

    m_logger->info("Sequential: {:.2f} ms (nonce: {})", sequential_time, sequential.nonce());
    m_logger->info("Parallel:   {:.2f} ms (nonce: {})", parallel_time, parallel.nonce());
    m_logger->info("Speedup:    {:.2f}x", parallel_time > 0.0 ? sequential_time / parallel_time : 0.0);
    return true;
}

bool Benchmark::difficulty_scaling()
{
    auto const payload = to_payload("scaling_test");
    for (std::uint32_t difficulty = 1; difficulty <= 5; ++difficulty)
    {
        pow::Search_outcome outcome;
        auto const time = time_ms([&] { outcome = run_search(std::make_shared<pow::Sequential_search>(payload, difficulty, m_limits)); });
        if (!outcome.found())
        {
            m_logger->error("Difficulty {}: {}", difficulty, pow::Result::code_to_string(outcome.result()));
            return false;
        }
        auto const hash = pow::get_hash(payload, outcome.nonce());
        m_logger->info("Difficulty {}: {:.2f} ms (nonce: {}) hash: {}...", difficulty, time, outcome.nonce(), hash.substr(0, 20));
    }
    return true;
}

bool Benchmark::worker_scaling()
{
    auto const payload = to_payload("thread_scaling_test");
    std::uint32_t const difficulty = 4;
    for (std::uint32_t workers : {1U, 2U, 4U, 8U})
    {
        pow::Search_outcome outcome;
        auto const time = time_ms([&] { outcome = run_search(std::make_shared<pow::Parallel_search>(payload, difficulty, workers, m_limits)); });
        if (!outcome.found())
        {
            m_logger->error("{} workers: {}", workers, pow::Result::code_to_string(outcome.result()));
            return false;
        }
        m_logger->info("{} workers: {:.2f} ms (nonce: {})", workers, time, outcome.nonce());
    }
    return true;
}

bool Benchmark::hash_rate()
{
    auto const payload = to_payload("hash_rate_test");
    std::uint32_t const difficulty = 3;

    pow::Search_outcome outcome;
    auto const time = time_ms([&] { outcome = run_search(std::make_shared<pow::Sequential_search>(payload, difficulty, m_limits)); });
    if (!outcome.found())
    {
        m_logger->error("Hash rate: {}", pow::Result::code_to_string(outcome.result()));
        return false;
    }

    // the sequential search tried nonces 0..nonce
    auto const hashes = outcome.nonce() + 1;
    m_logger->info("Computed {} hashes in {:.2f} ms", hashes, time);
    m_logger->info("Hash rate: {:.0f} H/s", time > 0.0 ? hashes / (time / 1000.0) : 0.0);
    return true;
}

}
