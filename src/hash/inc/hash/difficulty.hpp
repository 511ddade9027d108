#ifndef POWMINER_HASH_DIFFICULTY_HPP
#define POWMINER_HASH_DIFFICULTY_HPP

#include <cstdint>
#include <string>

namespace powminer {
namespace hash
{

// true if the first 'difficulty' characters of the hex digest are all '0'.
// Difficulty 0 is met by every digest, a digest shorter than the difficulty never meets it.
bool meets_difficulty(std::string const& digest, std::uint32_t difficulty);

// number of leading '0' characters of the hex digest
std::uint32_t leading_zeros(std::string const& digest);

}
}

#endif
