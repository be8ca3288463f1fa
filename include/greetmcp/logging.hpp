#pragma once
#include <spdlog/spdlog.h>

#include <string>

namespace greetmcp
{

struct Settings;

inline constexpr const char* LOGGER_NAME = "greetmcp";

/// Parse TRACE/DEBUG/INFO/WARN/WARNING/ERROR/CRITICAL/OFF (any case).
/// Throws ConfigError on anything else.
spdlog::level::level_enum parse_log_level(const std::string& level);

/// Install the stderr "greetmcp" logger as spdlog's default at the configured level.
/// Reuses an already registered logger of the same name.
void init_logging(const Settings& settings);

} // namespace greetmcp
