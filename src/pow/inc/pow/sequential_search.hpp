#ifndef POWMINER_POW_SEQUENTIAL_SEARCH_HPP
#define POWMINER_POW_SEQUENTIAL_SEARCH_HPP

#include "pow/search.hpp"
#include "pow/types.hpp"
#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <string>

namespace powminer {
namespace pow {

// Scans the range in ascending order on the calling thread, the first nonce meeting the difficulty wins.
class Sequential_search : public Search
{
public:

    Sequential_search(Payload payload, std::uint32_t difficulty, Search_limits limits = Search_limits{},
        Nonce_range range = Nonce_range::full());

    Search_outcome run() override;
    void stop() override;
    std::uint32_t worker_count() const override { return 1U; }
    void update_statistics(stats::Collector& stats_collector) override;

private:

    std::shared_ptr<spdlog::logger> m_logger;
    Payload m_payload;
    std::uint32_t m_difficulty;
    Search_limits m_limits;
    Nonce_range m_range;
    std::string m_log_leader;

    std::atomic<bool> m_started;
    std::atomic<bool> m_stop;

    std::atomic<std::uint64_t> m_hash_count;
    std::atomic<std::uint32_t> m_best_leading_zeros;
    std::atomic<std::uint32_t> m_met_difficulty_count;
};

}
}

#endif
