#ifndef POWMINER_CONFIG_CONFIG_HPP
#define POWMINER_CONFIG_CONFIG_HPP

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "config/job_config.hpp"
#include "config/types.hpp"
#include "pow/types.hpp"

namespace powminer
{
namespace config
{
class Config
{
public:

	explicit Config(std::shared_ptr<spdlog::logger> logger);

	bool read_config(std::string const& miner_config_file);
	// same as read_config for an already loaded document
	bool read_config(nlohmann::json const& j);

	std::uint16_t get_version() const { return m_version; }
	std::string const& get_logfile() const { return m_logfile; }
	std::uint16_t get_log_level() const { return m_log_level; }
	std::uint16_t get_print_statistics_interval() const { return m_print_statistics_interval; }
	pow::Search_limits const& get_search_limits() const { return m_search_limits; }
	std::vector<Job_config>& get_job_config() { return m_job_config; }
	std::vector<Job_config> const& get_job_config() const { return m_job_config; }

	// hardware concurrency clamped to the allowed worker range
	static std::uint32_t default_worker_count();

private:

	bool read_job_config(nlohmann::json const& j);
	bool read_search_limits(nlohmann::json const& j);

	void print_global_config() const;
	void print_job_config() const;

	std::shared_ptr<spdlog::logger> m_logger;
	std::uint16_t m_version;
	std::uint16_t m_log_level;
	std::string  m_logfile;

	// jobs
	std::vector<Job_config> m_job_config;

	// advanced configs
	std::uint16_t m_print_statistics_interval;
	pow::Search_limits m_search_limits;

};
}
}
#endif
