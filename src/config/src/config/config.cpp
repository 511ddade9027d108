#include "config/config.hpp"
#include "hash/byte_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace powminer
{
namespace config
{
	Config::Config(std::shared_ptr<spdlog::logger> logger)
		: m_logger{std::move(logger)}
		, m_version{1}
		, m_log_level{2}	// info level
		, m_logfile{""}		// no logfile usage, default
		, m_job_config{}
		, m_print_statistics_interval{5}
		, m_search_limits{}
	{
	}

	std::uint32_t Config::default_worker_count()
	{
		auto const hardware_threads = std::thread::hardware_concurrency();
		return std::clamp<std::uint32_t>(hardware_threads, 1U, pow::max_workers);
	}

	bool Config::read_config(std::string const& miner_config_file)
	{
		std::ifstream config_file(miner_config_file);
		if (!config_file.is_open())
		{
			m_logger->critical("Unable to read {}", miner_config_file);
			return false;
		}

		try
		{
			json j = json::parse(config_file);
			return read_config(j);
		}
		catch (std::exception& e)
		{
			m_logger->critical("Failed to parse config file. Exception: {}", e.what());
			return false;
		}
	}

	bool Config::read_config(nlohmann::json const& j)
	{
		try
		{
			if (j.count("version") != 0)
			{
				j.at("version").get_to(m_version);
			}

			if (!read_search_limits(j))
			{
				return false;
			}

			if (!read_job_config(j))
			{
				return false;
			}

			// advanced configs
			if (j.count("print_statistics_interval") != 0)
			{
				if (!j.at("print_statistics_interval").is_number_unsigned())
				{
					m_logger->error("print_statistics_interval must be a positive number");
					return false;
				}
				j.at("print_statistics_interval").get_to(m_print_statistics_interval);
			}

			if (j.count("log_level") != 0)
			{
				if (!j.at("log_level").is_number_unsigned())
				{
					m_logger->error("log_level must be a positive number");
					return false;
				}
				j.at("log_level").get_to(m_log_level);
			}

			if (j.count("logfile") != 0)
			{
				j.at("logfile").get_to(m_logfile);
			}

			print_global_config();
			print_job_config();
			return true;
		}
		catch (std::exception& e)
		{
			m_logger->critical("Failed to parse config file. Exception: {}", e.what());
			return false;
		}
	}

	bool Config::read_search_limits(nlohmann::json const& j)
	{
		m_search_limits = pow::Search_limits{};
		if (j.count("search_limits") == 0)
		{
			return true;
		}

		auto const& limits_json = j.at("search_limits");
		if (limits_json.count("abort_difficulty") != 0)
		{
			limits_json.at("abort_difficulty").get_to(m_search_limits.m_abort_difficulty);
		}
		if (limits_json.count("check_interval") != 0)
		{
			limits_json.at("check_interval").get_to(m_search_limits.m_check_interval);
		}
		if (limits_json.count("max_attempts") != 0)
		{
			limits_json.at("max_attempts").get_to(m_search_limits.m_max_attempts);
		}

		if (m_search_limits.m_check_interval == 0)
		{
			m_logger->error("search_limits/check_interval must be greater than 0");
			return false;
		}
		return true;
	}

	bool Config::read_job_config(nlohmann::json const& j)
	{
		m_job_config.clear();
		std::uint16_t internal_id = 0U;
		for (auto const& jobs_json : j.at("jobs"))
		{
			for (auto const& job_config_json : jobs_json)
			{
				Job_config job_config;
				job_config.m_internal_id = internal_id++;
				job_config_json.at("id").get_to(job_config.m_id);
				job_config_json.at("difficulty").get_to(job_config.m_difficulty);

				std::string payload = job_config_json.at("payload");
				std::string const encoding = job_config_json.value("encoding", std::string{"text"});

				if (encoding == "hex")
				{
					if (!IsHexString(payload))
					{
						m_logger->error("Job {}: payload is not a valid hex string", job_config.m_id);
						return false;
					}
					job_config.m_encoding = Payload_encoding::HEX;
					job_config.m_payload = HexStringToBytes(payload);
				}
				else if (encoding == "text")
				{
					job_config.m_encoding = Payload_encoding::TEXT;
					job_config.m_payload.assign(payload.begin(), payload.end());
				}
				else
				{
					// invalid config
					m_logger->error("Job {}: unknown payload encoding '{}'", job_config.m_id, encoding);
					return false;
				}

				job_config.m_mode = Search_mode::SEQUENTIAL;
				job_config.m_search_mode = Job_config_sequential{};
				if (job_config_json.count("mode") != 0)
				{
					auto const& mode_json = job_config_json.at("mode");
					std::string search = mode_json.value("search", std::string{"sequential"});
					if (search == "parallel")
					{
						Job_config_parallel parallel{default_worker_count()};
						if (mode_json.count("workers") != 0)
						{
							mode_json.at("workers").get_to(parallel.m_workers);
						}
						job_config.m_mode = Search_mode::PARALLEL;
						job_config.m_search_mode = parallel;
					}
					else if (search != "sequential")
					{
						// invalid config
						m_logger->error("Job {}: unknown search mode '{}'", job_config.m_id, search);
						return false;
					}
				}

				m_job_config.push_back(job_config);
			}
		}
		return true;
	}

	void Config::print_job_config() const
	{
		std::stringstream ss;
		ss << m_job_config.size() << " jobs configured" << std::endl;
		for (auto const& job : m_job_config)
		{
			ss << job.m_id << " difficulty: " << job.m_difficulty << " payload bytes: " << job.m_payload.size();
			switch (job.m_mode)
			{
			case Search_mode::SEQUENTIAL: ss << " mode: SEQUENTIAL"; break;
			case Search_mode::PARALLEL:
				ss << " mode: PARALLEL workers: " << std::get<Job_config_parallel>(job.m_search_mode).m_workers;
				break;
			}
			ss << std::endl;
		}

		m_logger->info(ss.str());
	}

	void Config::print_global_config() const
	{
		std::stringstream ss;
		ss << "Search limits: abort above difficulty " << m_search_limits.m_abort_difficulty
			<< " after " << m_search_limits.m_max_attempts << " attempts (checked every "
			<< m_search_limits.m_check_interval << ")";

		m_logger->info(ss.str());
	}
}
}
