#include "hash/difficulty.hpp"

namespace powminer
{
namespace hash
{

bool meets_difficulty(std::string const& digest, std::uint32_t difficulty)
{
    if (difficulty == 0)
    {
        return true;
    }

    if (digest.size() < difficulty)
    {
        return false;
    }

    for (std::uint32_t i = 0; i < difficulty; ++i)
    {
        if (digest[i] != '0')
        {
            return false;
        }
    }
    return true;
}

std::uint32_t leading_zeros(std::string const& digest)
{
    std::uint32_t count = 0;
    for (auto c : digest)
    {
        if (c != '0')
        {
            break;
        }
        ++count;
    }
    return count;
}

}
}
