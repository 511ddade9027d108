#ifndef POWMINER_CONFIG_VALIDATOR_HPP
#define POWMINER_CONFIG_VALIDATOR_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace powminer
{
namespace config
{
struct Validator_error
{
    std::string m_field;
    std::string m_message;
};

class Validator
{
public:

    Validator();

    bool check(std::string const& config_file);
    bool check(nlohmann::json const& j);
    std::string get_check_result() const;

    std::vector<Validator_error> const& get_mandatory_errors() const { return m_mandatory_fields; }
    std::vector<Validator_error> const& get_optional_errors() const { return m_optional_fields; }

private:

    void check_job(nlohmann::json const& job_config_json);

    std::vector<Validator_error> m_mandatory_fields;
    std::vector<Validator_error> m_optional_fields;

};

}
}
#endif
