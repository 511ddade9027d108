#include <string>
#include <iostream>
#include "miner.hpp"

void show_usage(std::string const& name)
{
    std::cerr << "Usage: " << name << " <option(s)> CONFIG_FILE\n"
              << "Options:\n"
              << "\t-h,--help\tShow this help message\n"
              << "\t-c,--check\tCheck for valid miner config file\n"
              << "\t-b,--benchmark\tRun the proof of work benchmark\n"
              << "\t-v,--version\tVersion of powminer"
              << std::endl;
}

int main(int argc, char **argv)
{
    std::string miner_config_file{"powminer.conf"};
    bool run_check = false;
    bool run_benchmark = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if ((arg == "-h") || (arg == "--help"))
        {
            show_usage(argv[0]);
            return 0;
        }
        else if ((arg == "-c") || (arg == "--check"))
        {
            run_check = true;
        }
        else if ((arg == "-b") || (arg == "--benchmark"))
        {
            run_benchmark = true;
        }
        else if ((arg == "-v") || (arg == "--version"))
        {
            std::cout << "powminer version: " << POWMINER_VERSION_MAJOR << "."
                << POWMINER_VERSION_MINOR << std::endl;
            return 0;
        }
        else
        {
            miner_config_file = argv[i];
        }
    }

    powminer::Miner miner;

    if(run_check)
    {
        return miner.check_config(miner_config_file) ? 0 : -1;
    }

    if(run_benchmark)
    {
        return miner.run_benchmark() ? 0 : -1;
    }

    if(!miner.init(miner_config_file))
    {
        return -1;
    }

    return miner.run() ? 0 : 1;
}
