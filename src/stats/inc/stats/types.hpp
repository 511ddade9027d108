#ifndef POWMINER_STATS_TYPES_HPP
#define POWMINER_STATS_TYPES_HPP

#include <algorithm>
#include <cstdint>

namespace powminer {
namespace stats
{

struct Global
{
    std::uint32_t m_jobs_solved{ 0 };
    std::uint32_t m_jobs_failed{ 0 };
    std::uint32_t m_jobs_cancelled{ 0 };

    Global& operator+=(Global const& other)
    {
        m_jobs_solved += other.m_jobs_solved;
        m_jobs_failed += other.m_jobs_failed;
        m_jobs_cancelled += other.m_jobs_cancelled;

        return *this;
    }
};

struct Hash
{
    std::uint64_t m_hash_count{0};
    std::uint32_t m_best_leading_zeros{0};
    std::uint32_t m_met_difficulty_count{0};
    std::uint32_t m_hash_error_count{0};

    Hash& operator+=(Hash const& other)
    {
        m_hash_count += other.m_hash_count;
        m_best_leading_zeros = std::max(m_best_leading_zeros, other.m_best_leading_zeros);
        m_met_difficulty_count += other.m_met_difficulty_count;
        m_hash_error_count += other.m_hash_error_count;
        return *this;
    }
};

}
}
#endif
