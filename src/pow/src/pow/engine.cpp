#include "pow/engine.hpp"
#include "pow/sequential_search.hpp"
#include "pow/parallel_search.hpp"
#include "hash/pow_hasher.hpp"
#include "hash/difficulty.hpp"

namespace powminer
{
namespace pow
{

Search_outcome compute(Payload const& payload, std::uint32_t difficulty, Search_limits const& limits)
{
    Sequential_search search{payload, difficulty, limits};
    return search.run();
}

Search_outcome compute_parallel(Payload const& payload, std::uint32_t difficulty, std::uint32_t worker_count,
    Search_limits const& limits)
{
    Parallel_search search{payload, difficulty, worker_count, limits};
    return search.run();
}

bool valid(Payload const& payload, std::uint64_t nonce, std::uint32_t difficulty)
{
    return hash::meets_difficulty(get_hash(payload, nonce), difficulty);
}

std::string get_hash(Payload const& payload, std::uint64_t nonce)
{
    hash::Pow_hasher hasher{payload};
    return hasher.calculate_hex(nonce);
}

}
}
