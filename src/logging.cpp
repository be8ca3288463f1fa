#include "greetmcp/logging.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/settings.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace greetmcp
{

spdlog::level::level_enum parse_log_level(const std::string& level)
{
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")
        return spdlog::level::trace;
    if (upper == "DEBUG")
        return spdlog::level::debug;
    if (upper == "INFO")
        return spdlog::level::info;
    if (upper == "WARN" || upper == "WARNING")
        return spdlog::level::warn;
    if (upper == "ERROR")
        return spdlog::level::err;
    if (upper == "CRITICAL")
        return spdlog::level::critical;
    if (upper == "OFF")
        return spdlog::level::off;
    throw ConfigError("unknown log level: " + level);
}

void init_logging(const Settings& settings)
{
    auto level = parse_log_level(settings.log_level);

    if (auto existing = spdlog::get(LOGGER_NAME))
    {
        spdlog::set_default_logger(existing);
    }
    else
    {
        auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
}

} // namespace greetmcp
