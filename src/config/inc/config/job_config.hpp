#ifndef POWMINER_CONFIG_JOB_CONFIG_HPP
#define POWMINER_CONFIG_JOB_CONFIG_HPP

#include <string>
#include <variant>
#include <vector>
#include <cstdint>
#include "config/types.hpp"

namespace powminer
{
namespace config
{
struct Job_config_sequential
{

};

struct Job_config_parallel
{
	std::uint32_t m_workers{1U};
};

class Job_config
{
public:

	std::string m_id{};
	std::uint16_t m_internal_id{0U};
	std::vector<std::uint8_t> m_payload{};
	Payload_encoding m_encoding{Payload_encoding::TEXT};
	std::uint32_t m_difficulty{0U};
	Search_mode m_mode{Search_mode::SEQUENTIAL};
	std::variant<Job_config_sequential, Job_config_parallel>
		m_search_mode;
};

}
}
#endif
