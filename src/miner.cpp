#include "miner.hpp"

#include "config/validator.hpp"
#include "job_runner.hpp"
#include "benchmark.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <asio.hpp>
#include <algorithm>
#include <csignal>
#include <fstream>

namespace powminer
{

	Miner::Miner()
	: m_io_context{std::make_shared<::asio::io_context>()}
	, m_signals{std::make_shared<::asio::signal_set>(*m_io_context)}
	, m_logger{ spdlog::stdout_color_mt("logger") }
	, m_config{ m_logger }
	{
		m_logger->set_level(spdlog::level::info);
		m_logger->set_pattern("[%D %H:%M:%S.%e][%^%l%$] %v");

		// Register to handle the signals that indicate when the search should stop.
		m_signals->add(SIGINT);
		m_signals->add(SIGTERM);
#if defined(SIGQUIT)
		m_signals->add(SIGQUIT);
#endif

		m_signals->async_wait([this](auto const& error, int signal_number)
		{
			if (error)
			{
				return;
			}
			m_logger->info("Signal {} received, stopping powminer", signal_number);
			if (m_job_runner)
			{
				m_job_runner->stop();
			}
			if (m_benchmark)
			{
				m_benchmark->stop();
			}
		});
	}

	Miner::~Miner()
	{
		stop_io_thread();
	}

	bool Miner::check_config(std::string const& miner_config_file)
	{
		m_logger->info("Running config check for {}", miner_config_file);
		std::ifstream config(miner_config_file);
		if (!config.is_open())
		{
			m_logger->critical("Unable to read {}", miner_config_file);
			return false;
		}

		config::Validator validator{};
		auto result = validator.check(miner_config_file);
		result ? m_logger->info(validator.get_check_result()) : m_logger->error(validator.get_check_result());
		return result;
	}

	bool Miner::init(std::string const& miner_config_file)
	{
		if (!m_config.read_config(miner_config_file))
		{
			return false;
		}

		auto const log_level = std::min<std::uint16_t>(m_config.get_log_level(), spdlog::level::off);
		m_logger->set_level(static_cast<spdlog::level::level_enum>(log_level));

		auto const& logfile = m_config.get_logfile();
		if (!logfile.empty())
		{
			try
			{
				// 5 MB per file, 3 rotated files
				auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logfile, 1024 * 1024 * 5, 3);
				file_sink->set_pattern("[%D %H:%M:%S.%e][%l] %v");
				m_logger->sinks().push_back(file_sink);
			}
			catch (spdlog::spdlog_ex const& e)
			{
				m_logger->critical("Unable to open logfile {}: {}", logfile, e.what());
				return false;
			}
		}

		m_job_runner = std::make_shared<Job_runner>(m_io_context, m_config);
		return true;
	}

	bool Miner::run()
	{
		if (!m_job_runner)
		{
			m_logger->error("Miner not initialised");
			return false;
		}

		start_io_thread();
		auto const result = m_job_runner->run_jobs();
		stop_io_thread();
		return result;
	}

	bool Miner::run_benchmark()
	{
		m_benchmark = std::make_shared<Benchmark>(m_config.get_search_limits());
		start_io_thread();
		auto const result = m_benchmark->run();
		stop_io_thread();
		return result;
	}

	void Miner::start_io_thread()
	{
		m_io_thread = std::thread([this]()
		{
			// keeps run() alive while no timer is pending
			auto work = ::asio::make_work_guard(*m_io_context);
			m_io_context->run();
		});
	}

	void Miner::stop_io_thread()
	{
		m_io_context->stop();
		if (m_io_thread.joinable())
		{
			m_io_thread.join();
		}
	}
}
