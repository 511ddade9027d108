#ifndef POWMINER_POW_LOGGER_HPP
#define POWMINER_POW_LOGGER_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace powminer {
namespace pow {

// The application registers "logger". Hosts embedding the engine may not, then spdlog's default logger is used.
inline std::shared_ptr<spdlog::logger> get_logger()
{
    auto logger = spdlog::get("logger");
    return logger ? logger : spdlog::default_logger();
}

}
}

#endif
