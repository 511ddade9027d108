#ifndef POWMINER_POW_SEARCH_HPP
#define POWMINER_POW_SEARCH_HPP

#include "pow/types.hpp"

namespace powminer {
namespace stats { class Collector; }
namespace pow {

class Search {
public:

    virtual ~Search() = default;

    // Blocks until a nonce is found or the search terminates otherwise. A search object runs once.
    virtual Search_outcome run() = 0;

    // Thread safe. A running search returns Result::search_cancelled as soon as its workers notice.
    virtual void stop() = 0;

    // number of workers reporting into the stats collector
    virtual std::uint32_t worker_count() const = 0;

    virtual void update_statistics(stats::Collector& stats_collector) = 0;
};

}
}

#endif
