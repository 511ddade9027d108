#ifndef POWMINER_POW_TYPES_HPP
#define POWMINER_POW_TYPES_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace powminer {
namespace pow {

namespace Result {

static constexpr unsigned int category_mask = 0xF0U;
static constexpr unsigned int code_mask = 0x0FU;

enum Category { general = 0x00, config = 0x10, search = 0x20 };

enum Code {
    found = Category::general,
    error,

    config_ok = Category::config,
    difficulty_too_high,
    invalid_worker_count,

    search_ok = Category::search,
    search_aborted,
    no_solution_found,
    search_cancelled,
};

inline Category category(Code code)
{
    auto const value = static_cast<unsigned int>(code);
    auto const category_value = (value & category_mask);
    return static_cast<Category>(category_value);
}

inline bool is_ok(Code code)
{
    auto const value = static_cast<unsigned int>(code);
    auto const code_value = (value & code_mask);
    return (code_value == 0U);
}

inline bool is_error(Code code)
{
    return !is_ok(code);
}

inline std::string code_to_string(Code code)
{
    switch (code)
    {
    case found: return "found";
    case error: return "error";
    case config_ok: return "config_ok";
    case difficulty_too_high: return "difficulty too high (max 64)";
    case invalid_worker_count: return "invalid number of workers (1-64)";
    case search_ok: return "search_ok";
    case search_aborted: return "difficulty too high, computation aborted";
    case no_solution_found: return "no valid nonce found";
    case search_cancelled: return "search cancelled";
    }
    return "unknown";
}

} // namespace Result

using Payload = std::vector<std::uint8_t>;

static constexpr std::uint32_t max_difficulty = 64;
static constexpr std::uint32_t max_workers = 64;

// Attempt budget for high difficulties. The defaults must not change, results depend on them.
struct Search_limits
{
    // the budget only applies when difficulty > abort_difficulty
    std::uint32_t m_abort_difficulty{20};
    std::uint64_t m_check_interval{1000000};
    std::uint64_t m_max_attempts{100000000};

    // offset is the distance of the nonce just tried from the start of the scanned range
    bool exceeded(std::uint32_t difficulty, std::uint64_t offset) const
    {
        if (difficulty <= m_abort_difficulty || offset == 0 || m_check_interval == 0)
        {
            return false;
        }
        return (offset % m_check_interval == 0) && offset > m_max_attempts;
    }
};

// inclusive range of nonces
struct Nonce_range
{
    std::uint64_t m_first{0};
    std::uint64_t m_last{std::numeric_limits<std::uint64_t>::max()};

    static Nonce_range full() { return Nonce_range{}; }
};

class Search_outcome
{
public:

    Search_outcome() = default;
    explicit Search_outcome(Result::Code result) : m_result{result} {}

    static Search_outcome success(std::uint64_t nonce)
    {
        Search_outcome outcome{Result::found};
        outcome.m_nonce = nonce;
        return outcome;
    }

    bool found() const { return m_result == Result::found; }
    Result::Code result() const { return m_result; }
    // only meaningful when found()
    std::uint64_t nonce() const { return m_nonce; }

private:

    Result::Code m_result{Result::no_solution_found};
    std::uint64_t m_nonce{0};
};

}
}

#endif
