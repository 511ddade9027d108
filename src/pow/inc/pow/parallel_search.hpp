#ifndef POWMINER_POW_PARALLEL_SEARCH_HPP
#define POWMINER_POW_PARALLEL_SEARCH_HPP

#include "pow/search.hpp"
#include "pow/types.hpp"
#include <spdlog/spdlog.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace powminer {
namespace hash { class Pow_hasher; }
namespace pow {

// One thread per partition of the nonce range. The first worker to find a valid nonce wins,
// which is a valid nonce but not necessarily the smallest one.
class Parallel_search : public Search
{
public:

    // builds the hasher of one worker, called on the worker thread
    using Hasher_factory = std::function<std::unique_ptr<hash::Pow_hasher>(Payload const& payload, std::uint32_t worker_id)>;

    Parallel_search(Payload payload, std::uint32_t difficulty, std::uint32_t worker_count,
        Search_limits limits = Search_limits{}, Nonce_range range = Nonce_range::full());
    ~Parallel_search();

    Parallel_search(Parallel_search const&) = delete;
    Parallel_search& operator=(Parallel_search const&) = delete;

    Search_outcome run() override;
    void stop() override;
    // number of partitions, 0 if the requested worker count is invalid
    std::uint32_t worker_count() const override { return static_cast<std::uint32_t>(m_workers.size()); }
    void update_statistics(stats::Collector& stats_collector) override;

    std::vector<Nonce_range> get_partitions() const;

    // replaces the default hasher construction, must be set before run()
    void set_hasher_factory(Hasher_factory hasher_factory) { m_hasher_factory = std::move(hasher_factory); }

private:

    struct Worker
    {
        std::uint32_t m_id{0U};
        Nonce_range m_range;
        std::string m_log_leader;
        std::thread m_thread;

        std::atomic<std::uint64_t> m_hash_count{0};
        std::atomic<std::uint32_t> m_best_leading_zeros{0};
        std::atomic<std::uint32_t> m_met_difficulty_count{0};
        std::atomic<std::uint32_t> m_error_count{0};
        std::atomic<bool> m_aborted{false};
    };

    void run_worker(Worker& worker);
    void join_workers();
    bool is_terminated() const;

    std::shared_ptr<spdlog::logger> m_logger;
    Payload m_payload;
    std::uint32_t m_difficulty;
    std::uint32_t m_requested_worker_count;
    Search_limits m_limits;
    std::string m_log_leader;
    Hasher_factory m_hasher_factory;

    std::vector<std::unique_ptr<Worker>> m_workers;

    std::atomic<bool> m_started;
    std::atomic<bool> m_stop;
    // shared between the workers: the flag goes false -> true once, only its winner writes the nonce
    std::atomic<bool> m_found;
    std::atomic<std::uint64_t> m_result_nonce;
};

}
}

#endif
