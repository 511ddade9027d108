#ifndef POWMINER_MINER_HPP
#define POWMINER_MINER_HPP

#include <memory>
#include <string>
#include <thread>

#include "config/config.hpp"
#include <spdlog/spdlog.h>
#include <asio/signal_set.hpp>

namespace asio {
	class io_context;
}
namespace powminer
{

class Job_runner;
class Benchmark;

class Miner
{
public:

	Miner();
	~Miner();

	bool init(std::string const& miner_config_file);
	bool check_config(std::string const& miner_config_file);
	// runs all configured jobs, returns true if all of them were solved
	bool run();
	bool run_benchmark();

private:

	void start_io_thread();
	void stop_io_thread();

	std::shared_ptr<::asio::io_context> m_io_context;
	std::shared_ptr<::asio::signal_set> m_signals;
	std::thread m_io_thread;
	std::shared_ptr<Job_runner> m_job_runner;
	std::shared_ptr<Benchmark> m_benchmark;
	std::shared_ptr<spdlog::logger> m_logger;

	config::Config m_config;
};

}


#endif
