#include "config/validator.hpp"
#include "hash/byte_utils.hpp"
#include "pow/types.hpp"

#include <fstream>
#include <sstream>
#include <iostream>

using json = nlohmann::json;

namespace powminer
{
namespace config
{
Validator::Validator()
: m_mandatory_fields{}
, m_optional_fields{}
{
}

bool Validator::check(std::string const& config_file)
{
    std::ifstream config(config_file);
    if (!config.is_open())
    {
        std::cerr << "Unable to read " << config_file << std::endl;
        return false;
    }

    try
    {
        json j = json::parse(config);
        return check(j);
    }
    catch(const std::exception& e)
    {
        std::cerr << "Incomplete json file" <<std::endl;
        std::cerr << e.what();
        return false;
    }
}

bool Validator::check(nlohmann::json const& j)
{
    m_mandatory_fields.clear();
    m_optional_fields.clear();

    // jobs
    if (j.count("jobs") == 0)
    {
        m_mandatory_fields.push_back(Validator_error{"jobs", ""});
    }
    else if (!j.at("jobs").is_array())
    {
        m_mandatory_fields.push_back(Validator_error{"jobs", "Not an array"});
    }
    else
    {
        for (auto const& jobs_json : j.at("jobs"))
        {
            if (!jobs_json.is_object())
            {
                m_mandatory_fields.push_back(Validator_error{"jobs/job", "Not an object"});
                continue;
            }
            for (auto const& job_config_json : jobs_json)
            {
                check_job(job_config_json);
            }
        }
    }

    //search limits
    if (j.count("search_limits") != 0)
    {
        auto const& limits_json = j.at("search_limits");
        for (auto const* field : {"abort_difficulty", "check_interval", "max_attempts"})
        {
            if (limits_json.count(field) != 0 && !limits_json.at(field).is_number_unsigned())
            {
                m_optional_fields.push_back(Validator_error{std::string{"search_limits/"} + field, "Not a positive number"});
            }
        }
        if (limits_json.count("check_interval") != 0 && limits_json.at("check_interval") == 0)
        {
            m_optional_fields.push_back(Validator_error{"search_limits/check_interval", "Must be greater than 0"});
        }
    }

    //advanced config
    if (j.count("print_statistics_interval") != 0)
    {
        if(!j.at("print_statistics_interval").is_number_unsigned())
        {
            m_optional_fields.push_back(Validator_error{"print_statistics_interval", "Not a positive number"});
        }
    }
    if (j.count("log_level") != 0)
    {
        if(!j.at("log_level").is_number_unsigned())
        {
            m_optional_fields.push_back(Validator_error{"log_level", "Not a positive number"});
        }
    }
    if (j.count("logfile") != 0)
    {
        if(!j.at("logfile").is_string())
        {
            m_optional_fields.push_back(Validator_error{"logfile", "Not a string"});
        }
    }

    return m_mandatory_fields.empty() && m_optional_fields.empty();
}

void Validator::check_job(nlohmann::json const& job_config_json)
{
    if (job_config_json.count("id") == 0 || !job_config_json.at("id").is_string())
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/id", "Not a string"});
        return;
    }

    if (job_config_json.count("difficulty") == 0)
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/difficulty", ""});
    }
    else if (!job_config_json.at("difficulty").is_number_unsigned())
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/difficulty", "Not a positive number"});
    }
    else if (job_config_json.at("difficulty").get<std::uint64_t>() > pow::max_difficulty)
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/difficulty", "Greater than 64"});
    }

    std::string encoding = "text";
    if (job_config_json.count("encoding") != 0)
    {
        auto const& encoding_json = job_config_json.at("encoding");
        if (!encoding_json.is_string() || (encoding_json != "text" && encoding_json != "hex"))
        {
            m_optional_fields.push_back(Validator_error{"jobs/job/encoding", "Not 'text' or 'hex'"});
        }
        else
        {
            encoding = encoding_json.get<std::string>();
        }
    }

    if (job_config_json.count("payload") == 0)
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/payload", ""});
    }
    else if (!job_config_json.at("payload").is_string())
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/payload", "Not a string"});
    }
    else if (encoding == "hex" && !IsHexString(job_config_json.at("payload").get<std::string>()))
    {
        m_mandatory_fields.push_back(Validator_error{"jobs/job/payload", "Not a hex string"});
    }

    if (job_config_json.count("mode") != 0)
    {
        auto const& mode_json = job_config_json.at("mode");
        if (mode_json.count("search") != 0 && mode_json.at("search") != "sequential" && mode_json.at("search") != "parallel")
        {
            m_mandatory_fields.push_back(Validator_error{"jobs/job/mode/search", "Not 'sequential' or 'parallel'"});
        }
        if (mode_json.count("workers") != 0)
        {
            auto const& workers_json = mode_json.at("workers");
            if (!workers_json.is_number_unsigned())
            {
                m_mandatory_fields.push_back(Validator_error{"jobs/job/mode/workers", "Not a positive number"});
            }
            else if (workers_json.get<std::uint64_t>() == 0 || workers_json.get<std::uint64_t>() > pow::max_workers)
            {
                m_mandatory_fields.push_back(Validator_error{"jobs/job/mode/workers", "Not in range 1-64"});
            }
        }
    }
}

std::string Validator::get_check_result() const
{
    std::stringstream result;
    result << "Mandatory fields errors: " << m_mandatory_fields.size() << std::endl;
    result << "Optional fields errors: " << m_optional_fields.size() << std::endl;

    if(!m_mandatory_fields.empty())
    {
        result << "--- Mandatory fields ---" << std::endl;
    }
    for(auto const& error : m_mandatory_fields)
    {
        result << "[" << error.m_field << "]\t" << (error.m_message.empty() ? " is missing" : error.m_message) << std::endl;
    }

    if(!m_optional_fields.empty())
    {
        result << "--- Optional fields ---" << std::endl;
    }
    for(auto const& error : m_optional_fields)
    {
        result << "[" << error.m_field << "]\t" << (error.m_message.empty() ? " is missing" : error.m_message) << std::endl;
    }

    return result.str();
}

}
}
