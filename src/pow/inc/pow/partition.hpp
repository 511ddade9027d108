#ifndef POWMINER_POW_PARTITION_HPP
#define POWMINER_POW_PARTITION_HPP

#include "pow/types.hpp"
#include <vector>

namespace powminer {
namespace pow {

// Splits range into 'count' contiguous, disjoint sub ranges of size (range size / count).
// The last sub range ends at range.m_last and absorbs the remainder.
// Returns fewer ranges than 'count' when the range holds fewer nonces. count must be > 0.
std::vector<Nonce_range> partition(Nonce_range const& range, std::uint32_t count);

}
}

#endif
