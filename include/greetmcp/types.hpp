#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace greetmcp
{

using Json = nlohmann::json;

/// Latest MCP protocol revision spoken by the server.
inline constexpr const char* LATEST_PROTOCOL_VERSION = "2025-03-26";

/// HTTP header carrying the session identifier in both directions.
inline constexpr const char* SESSION_ID_HEADER = "Mcp-Session-Id";

/// Log levels of notifications/message (RFC 5424 order, lowest first).
enum class LogLevel
{
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Notice:
        return "notice";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Alert:
        return "alert";
    case LogLevel::Emergency:
        return "emergency";
    }
    return "info";
}

inline std::optional<LogLevel> log_level_from_string(const std::string& s)
{
    if (s == "debug")
        return LogLevel::Debug;
    if (s == "info")
        return LogLevel::Info;
    if (s == "notice")
        return LogLevel::Notice;
    if (s == "warning")
        return LogLevel::Warning;
    if (s == "error")
        return LogLevel::Error;
    if (s == "critical")
        return LogLevel::Critical;
    if (s == "alert")
        return LogLevel::Alert;
    if (s == "emergency")
        return LogLevel::Emergency;
    return std::nullopt;
}

/// Client identity reported in initialize params.clientInfo
struct Implementation
{
    std::string name;
    std::string version;
};

// nlohmann::json adapters
inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}
inline void from_json(const Json& j, Implementation& impl)
{
    impl.name = j.value("name", std::string());
    impl.version = j.value("version", std::string());
}

} // namespace greetmcp
