#ifndef POWMINER_POW_ENGINE_HPP
#define POWMINER_POW_ENGINE_HPP

// Entry points for hosts embedding the engine. Plain values in, plain values out.

#include "pow/types.hpp"
#include <cstdint>
#include <string>

namespace powminer {
namespace pow {

// Smallest nonce whose hash meets the difficulty.
// Fails with difficulty_too_high, search_aborted or no_solution_found.
Search_outcome compute(Payload const& payload, std::uint32_t difficulty,
    Search_limits const& limits = Search_limits{});

// A nonce meeting the difficulty, found by worker_count threads. Not necessarily the smallest.
// Fails with difficulty_too_high, invalid_worker_count or no_solution_found.
Search_outcome compute_parallel(Payload const& payload, std::uint32_t difficulty, std::uint32_t worker_count,
    Search_limits const& limits = Search_limits{});

bool valid(Payload const& payload, std::uint64_t nonce, std::uint32_t difficulty);

// lowercase hex SHA-256 of payload || nonce (8 bytes little endian)
std::string get_hash(Payload const& payload, std::uint64_t nonce);

}
}

#endif
