#include "logger/spdlog_init.hpp"

#include "utils/string.hpp"
#include <map>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace cfgval::logging {
namespace {
constexpr char CONSOLE_LOGGER_NAME[] = "cfgval_console";
} // namespace

void init_spdlog(const std::string &level)
{
    static const std::map<std::string, spdlog::level::level_enum> priority_map = {
        {"trace", spdlog::level::trace},  {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    };

    const auto priority_it = priority_map.find(utils::string::to_lower(level));
    if (priority_it == priority_map.end())
        throw std::runtime_error("Invalid log level: " + level);

    // diagnostics go to stderr so converted values on stdout stay clean
    auto console_logger = spdlog::get(CONSOLE_LOGGER_NAME);
    if (!console_logger)
        console_logger = spdlog::stderr_color_mt(CONSOLE_LOGGER_NAME);
    spdlog::set_default_logger(console_logger);

    spdlog::set_level(priority_it->second);
}

} // namespace cfgval::logging
